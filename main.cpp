#include "argot.hpp"
#include <iostream>
#include <map>
#include <string>
#include <variant>
#include <vector>

struct Checkout_cmd
{
    std::string branch;
    bool track = false;
};

struct Commit_cmd
{
    bool all = false;
    std::string message;
};

struct Push_cmd
{
    std::string remote;
    std::string branch;
    bool set_upstream = false;
};

struct Args
{
    bool quiet = false;
    std::string git_dir;
    std::map<std::string, std::string> config;
    std::variant<std::monostate, Checkout_cmd, Commit_cmd, Push_cmd> command;
};

int main(int argc, char *argv[])
{
    // 1. Describe the configuration
    // An empty program name makes must_parse use basename(argv[0])
    argot::Parser<Args> parser("", [](argot::Command<Args>& c) {
        c.about("A small git-like front end showing subcommands, env fallback and repeated options");

        // -- Global flag, still accepted after a subcommand: mygit commit -q
        c.add(ARGOT_FIELD(Args, quiet), argot::Opt<bool>{{"", "q"}, "suppress output"});

        // -- CLI > $GIT_DIR > default
        c.add(ARGOT_FIELD(Args, git_dir), argot::Opt<std::string>{}.deflt(".git").env("GIT_DIR").help("repository location"));

        // -- Repeated KEY=VALUE pairs: -c user.name=me -c core.pager=less
        c.add(ARGOT_FIELD(Args, config), argot::Opt<std::map<std::string, std::string>>{{"config", "c"}, "override a config value"}
                .separate()
                .meta("KEY=VALUE"));

        // -- Subcommands share one variant member, so at most one is ever selected
        c.subcommand<Checkout_cmd>(&Args::command, {"checkout", "switch branches"}, [](argot::Command<Checkout_cmd>& s) {
            s.add(ARGOT_FIELD(Checkout_cmd, branch), argot::Opt<std::string>{}.positional().help("branch to check out"));
            s.add(ARGOT_FIELD(Checkout_cmd, track), argot::Opt<bool>{{"", "t"}, "set up upstream tracking"});
        });
        c.subcommand<Commit_cmd>(&Args::command, {"commit", "record changes to the repository"}, [](argot::Command<Commit_cmd>& s) {
            s.add(ARGOT_FIELD(Commit_cmd, all), argot::Opt<bool>{{"", "a"}, "stage all modified files"});
            s.add(ARGOT_FIELD(Commit_cmd, message), argot::Opt<std::string>{{"", "m"}, "commit message"}.required());
        });
        c.subcommand<Push_cmd>(&Args::command, {"push", "update remote refs"}, [](argot::Command<Push_cmd>& s) {
            s.add(ARGOT_FIELD(Push_cmd, remote), argot::Opt<std::string>{}.positional());
            s.add(ARGOT_FIELD(Push_cmd, branch), argot::Opt<std::string>{}.positional());
            s.add(ARGOT_FIELD(Push_cmd, set_upstream), argot::Opt<bool>{{"", "u"}, "remember the remote as upstream"});
        });
        c.require_subcommand();
    });

    // 2. Configure Parser (Optional)
    parser.cfg_.allow_combined_short_flags = true;   // -am "msg"
    parser.cfg_.allow_short_value_concat = true;     // -mmsg

    // 3. Parse Arguments
    // Help exits with 0, errors print usage + "error: ..." and exit non-zero
    Args args;
    auto result = parser.must_parse(args, argc, argv);
    if (!result)
        return 1;

    // 4. Use Values
    if (!args.quiet)
    {
        std::cout << "git dir: " << args.git_dir << "\n";
        for (const auto& [key, value] : args.config)
            std::cout << "config:  " << key << " = " << value << "\n";
    }

    std::visit([](const auto& cmd) {
        using C = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<C, Checkout_cmd>)
            std::cout << "checkout requested for branch " << cmd.branch << (cmd.track ? " (tracking)" : "") << "\n";
        else if constexpr (std::is_same_v<C, Commit_cmd>)
            std::cout << "commit requested with message \"" << cmd.message << "\"" << (cmd.all ? " (all files)" : "") << "\n";
        else if constexpr (std::is_same_v<C, Push_cmd>)
            std::cout << "push requested from " << cmd.branch << " to " << cmd.remote << "\n";
    }, args.command);

    return 0;
}
