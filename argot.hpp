#ifndef __ARGOT_HPP_
#define __ARGOT_HPP_

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <new>
#include <optional>
#include <source_location>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <unistd.h>

// -----------------------------------------------------------------------------
// CONFIGURATION & MACROS
// -----------------------------------------------------------------------------

#ifndef ARGOT_DEBUG_LEVEL
    #define ARGOT_DEBUG_LEVEL 0
#endif

namespace argot::detail {

template <typename... Args>
inline auto debug_line(int level, Args&&... args) -> void
{
    std::ostringstream ss;
    (ss << ... << std::forward<Args>(args));
    std::cerr << "[ARGOT_DBG: L" << level << "]: " << ss.str() << '\n';
}

} // namespace argot::detail

#define ARGOT_DEBUG_L1(...) do { if constexpr (ARGOT_DEBUG_LEVEL >= 1) ::argot::detail::debug_line(1, __VA_ARGS__); } while(0)
#define ARGOT_DEBUG_L2(...) do { if constexpr (ARGOT_DEBUG_LEVEL >= 2) ::argot::detail::debug_line(2, __VA_ARGS__); } while(0)
#define ARGOT_DEBUG_L3(...) do { if constexpr (ARGOT_DEBUG_LEVEL >= 3) ::argot::detail::debug_line(3, __VA_ARGS__); } while(0)

// Supplies a member pointer together with the member's spelling, from which the
// long option name (or positional placeholder, or subcommand name) is derived.
#define ARGOT_FIELD(Type, member) &Type::member, ::argot::Field_name{ #member }

namespace argot {

// -----------------------------------------------------------------------------
// UTILITIES & CONCEPTS
// -----------------------------------------------------------------------------

template<typename T> struct is_std_vector : std::false_type {};
template<typename U, typename A> struct is_std_vector<std::vector<U, A>> : std::true_type {};
template<typename T> inline constexpr bool is_std_vector_v = is_std_vector<T>::value;

template<typename T> struct is_std_map : std::false_type {};
template<typename K, typename V, typename C, typename A> struct is_std_map<std::map<K, V, C, A>> : std::true_type {};
template<typename T> inline constexpr bool is_std_map_v = is_std_map<T>::value;

template<typename T> struct is_std_optional : std::false_type {};
template<typename U> struct is_std_optional<std::optional<U>> : std::true_type {};
template<typename T> inline constexpr bool is_std_optional_v = is_std_optional<T>::value;

template<typename T> struct is_std_variant : std::false_type {};
template<typename... Us> struct is_std_variant<std::variant<Us...>> : std::true_type {};
template<typename T> inline constexpr bool is_std_variant_v = is_std_variant<T>::value;

template<typename S, typename V> struct variant_has_alternative : std::false_type {};
template<typename S, typename... Us>
struct variant_has_alternative<S, std::variant<Us...>> : std::bool_constant<(std::is_same_v<S, Us> || ...)> {};

// Specialize for user types:
//   template<> struct argot::Value_parser<Level> {
//       static constexpr std::string_view name = "level";
//       static auto parse(std::string_view s) -> std::expected<Level, std::string>;
//   };
template<typename T>
struct Value_parser {};

template<typename T>
concept Custom_value_C = requires(std::string_view s) {
    { Value_parser<T>::parse(s) } -> std::same_as<std::expected<T, std::string>>;
    { Value_parser<T>::name } -> std::convertible_to<std::string_view>;
};

template<typename T>
concept Supported_Scalar_C = Custom_value_C<T> || std::is_same_v<T, bool> || std::integral<T> || std::floating_point<T>
                          || std::is_same_v<T, std::string> || std::is_same_v<T, std::filesystem::path>;

template<typename T>
struct _optional_value_ { using type = void; };
template<typename U>
struct _optional_value_<std::optional<U>> { using type = U; };

// Member types a field may bind to
template<typename M>
concept Bindable_C = Supported_Scalar_C<M>
                  || (is_std_optional_v<M> && Supported_Scalar_C<typename _optional_value_<M>::type>)
                  || (is_std_vector_v<M> && Supported_Scalar_C<typename M::value_type>)
                  || (is_std_map_v<M> && Supported_Scalar_C<typename M::key_type> && Supported_Scalar_C<typename M::mapped_type>);

template<typename T>
concept Streamable_C = requires(std::ostream& os, const T& v) { os << v; };

struct Field_name
{
    std::string_view spelled;
};

// "dry_run", "dryRun" and "DryRun" all become "dry-run"
[[nodiscard]]
inline auto to_kebab(std::string_view s) -> std::string
{
    std::string out;
    out.reserve(s.size() + 4);
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '_')
        {
            if (!out.empty() && out.back() != '-') out.push_back('-');
            continue;
        }
        if (std::isupper(c))
        {
            unsigned char prev = i > 0 ? static_cast<unsigned char>(s[i - 1]) : 0;
            if (!out.empty() && out.back() != '-' && (std::islower(prev) || std::isdigit(prev))) out.push_back('-');
            out.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

[[nodiscard]]
inline auto to_placeholder(std::string_view s) -> std::string
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s)
    {
        if (ch == '-') out.push_back('_');
        else out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return out;
}

[[nodiscard]]
inline auto looks_numeric(std::string_view s) -> bool
{
    std::size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i >= s.size()) return false;

    // "-inf" and "-nan" are short clusters, not numbers
    auto digit = [&](std::size_t at) { return at < s.size() && std::isdigit(static_cast<unsigned char>(s[at])); };
    if (!digit(i) && !(s[i] == '.' && digit(i + 1))) return false;

    if (s[0] == '+') s.remove_prefix(1);
    double d{};
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), d);
    return ec == std::errc{} && p == s.data() + s.size();
}

// -----------------------------------------------------------------------------
// MEMORY MANAGEMENT
// -----------------------------------------------------------------------------

// Owns every descriptor and interned name of one parser. Objects are destroyed
// in reverse order of creation when the parser goes away.
class Arena
{
    struct Cleanup
    {
        void* obj;
        void (*destroy)(void*);
    };

    std::size_t chunk_size_;
    std::size_t used_     = 0;
    std::size_t capacity_ = 0;
    std::vector<std::unique_ptr<std::byte[]>> chunks_;
    std::vector<Cleanup> cleanups_;

public:
    explicit Arena(std::size_t chunk_size = 4096) : chunk_size_(chunk_size) {}

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    ~Arena()
    {
        ARGOT_DEBUG_L2("Arena: Releasing ", cleanups_.size(), " object(s) in ", chunks_.size(), " chunk(s)");
        for (auto it = cleanups_.rbegin(); it != cleanups_.rend(); ++it) it->destroy(it->obj);
    }

    template<typename T, typename... Args>
    [[nodiscard]]
    T* make(Args&&... args)
    {
        T* obj = ::new (reserve(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
        if constexpr (!std::is_trivially_destructible_v<T>)
            cleanups_.push_back(Cleanup{ obj, [](void* p) { static_cast<T*>(p)->~T(); } });
        return obj;
    }

    // Interned copy; empty input yields an empty view
    [[nodiscard]]
    std::string_view str(std::string_view s)
    {
        if (s.empty()) return {};
        auto* mem = static_cast<char*>(reserve(s.size(), 1));
        std::memcpy(mem, s.data(), s.size());
        return { mem, s.size() };
    }

    [[nodiscard]]
    std::size_t blocks() const noexcept { return chunks_.size(); }

private:
    // Chunks come from operator new[], so offsets aligned within a chunk are aligned in memory
    void* reserve(std::size_t n, std::size_t align)
    {
        std::size_t at = (used_ + align - 1) & ~(align - 1);
        if (chunks_.empty() || at + n > capacity_)
        {
            capacity_ = std::max(chunk_size_, n);
            ARGOT_DEBUG_L3("Arena: New chunk of ", capacity_, " bytes");
            chunks_.push_back(std::make_unique<std::byte[]>(capacity_));
            at = 0;
        }
        used_ = at + n;
        return chunks_.back().get() + at;
    }
};

// -----------------------------------------------------------------------------
// ERRORS
// -----------------------------------------------------------------------------

// Thrown while a configuration shape is declared. Always a programming error.
class Shape_error : public std::logic_error
{
public:
    Shape_error(const std::string& what, std::source_location loc)
    : std::logic_error(std::string(loc.file_name()) + ":" + std::to_string(loc.line()) + ": " + what)
    {}
};

enum Error_kind : uint8_t { Unknown_flag, Conversion, Missing_required, Ambiguous_subcommand, Missing_value, Repeated_option };

struct Error
{
    Error_kind kind;
    std::string message;
    std::string name{};       // offending flag, placeholder or environment variable
    std::string literal{};    // offending token text, when there is one
    std::string type_name{};  // conversion target, for Conversion errors
    std::vector<std::string> chain{};   // subcommands resolved when the failure happened
};

// -----------------------------------------------------------------------------
// VALUE CONVERSION
// -----------------------------------------------------------------------------

template<typename T>
requires Supported_Scalar_C<T>
[[nodiscard]]
constexpr auto type_name() -> std::string_view
{
    if constexpr (Custom_value_C<T>)                           return Value_parser<T>::name;
    else if constexpr (std::is_same_v<T, bool>)                return "bool";
    else if constexpr (std::is_same_v<T, std::string>)         return "string";
    else if constexpr (std::is_same_v<T, std::filesystem::path>) return "path";
    else if constexpr (std::is_same_v<T, float>)               return "float";
    else if constexpr (std::is_same_v<T, double>)              return "double";
    else if constexpr (std::is_same_v<T, long double>)         return "long double";
    else if constexpr (std::is_same_v<T, int>)                 return "int";
    else if constexpr (std::is_same_v<T, unsigned>)            return "uint";
    else if constexpr (std::is_signed_v<T>)
    {
        if constexpr (sizeof(T) == 1) return "int8";
        else if constexpr (sizeof(T) == 2) return "int16";
        else if constexpr (sizeof(T) == 4) return "int32";
        else return "int64";
    }
    else
    {
        if constexpr (sizeof(T) == 1) return "uint8";
        else if constexpr (sizeof(T) == 2) return "uint16";
        else if constexpr (sizeof(T) == 4) return "uint32";
        else return "uint64";
    }
}

template<typename Dest>
requires Supported_Scalar_C<Dest>
auto string_to_value(std::string_view s) -> std::expected<Dest, std::string>
{
    if constexpr (Custom_value_C<Dest>)
    {
        return Value_parser<Dest>::parse(s);
    }
    else if constexpr (std::is_same_v<Dest, std::string>)
    {
        return std::string(s);
    }
    else if constexpr (std::is_same_v<Dest, std::filesystem::path>)
    {
        return std::filesystem::path(s);
    }
    else if constexpr (std::is_same_v<Dest, bool>)
    {
        if (s == "true" || s == "1" || s == "on" || s == "yes" || s == "y" || s == "t") return true;
        if (s == "false" || s == "0" || s == "off" || s == "no" || s == "n" || s == "f") return false;
        ARGOT_DEBUG_L3("ParseValue: Failed bool conversion for '", s, "'");
        return std::unexpected(std::string("invalid boolean"));
    }
    else
    {
        // from_chars takes no leading '+'; "+-5" and "++5" stay invalid
        if (s.size() > 1 && s[0] == '+' && s[1] != '+' && s[1] != '-') s.remove_prefix(1);

        Dest v{};
        auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc::result_out_of_range)
        {
            ARGOT_DEBUG_L3("ParseValue: '", s, "' out of range for ", type_name<Dest>());
            return std::unexpected(std::string("value out of range"));
        }
        if (ec != std::errc{} || p != s.data() + s.size())
        {
            ARGOT_DEBUG_L3("ParseValue: Failed numeric conversion for '", s, "'");
            return std::unexpected(std::string("invalid syntax"));
        }
        return v;
    }
}

template<typename M>
[[nodiscard]]
auto value_to_string(const M& v) -> std::string
{
    if constexpr (std::is_same_v<M, bool>) return v ? "true" : "false";
    else if constexpr (std::is_same_v<M, std::string>) return v;
    else if constexpr (std::is_same_v<M, std::filesystem::path>) return v.string();
    else if constexpr (is_std_optional_v<M>) return v ? value_to_string(*v) : std::string{};
    else if constexpr (is_std_vector_v<M>)
    {
        std::string out;
        for (const auto& e : v)
        {
            if (!out.empty()) out += ",";
            out += value_to_string(static_cast<typename M::value_type>(e));
        }
        return out;
    }
    else if constexpr (is_std_map_v<M>)
    {
        std::string out;
        for (const auto& [k, e] : v)
        {
            if (!out.empty()) out += ",";
            out += value_to_string(k) + "=" + value_to_string(e);
        }
        return out;
    }
    else if constexpr (Streamable_C<M>)
    {
        std::ostringstream ss;
        ss << v;
        return ss.str();
    }
    else return {};
}

template<typename M>
requires Bindable_C<M>
[[nodiscard]]
auto member_type_name() -> std::string
{
    if constexpr (is_std_vector_v<M>)        return std::string(type_name<typename M::value_type>());
    else if constexpr (is_std_map_v<M>)      return std::string(type_name<typename M::key_type>()) + "=" + std::string(type_name<typename M::mapped_type>());
    else if constexpr (is_std_optional_v<M>) return std::string(type_name<typename _optional_value_<M>::type>());
    else                                     return std::string(type_name<M>());
}

// Sets a scalar member, or appends one element to a multi-value member
template<typename M>
requires Bindable_C<M>
auto assign_member(M& dst, std::string_view s) -> std::expected<void, std::string>
{
    if constexpr (is_std_vector_v<M>)
    {
        auto res = string_to_value<typename M::value_type>(s);
        if (!res) return std::unexpected(res.error());
        dst.push_back(std::move(*res));
    }
    else if constexpr (is_std_map_v<M>)
    {
        auto eq = s.find('=');
        if (eq == std::string_view::npos) return std::unexpected(std::string("expected KEY=VALUE"));
        auto key = string_to_value<typename M::key_type>(s.substr(0, eq));
        if (!key) return std::unexpected(key.error());
        auto val = string_to_value<typename M::mapped_type>(s.substr(eq + 1));
        if (!val) return std::unexpected(val.error());
        dst.insert_or_assign(std::move(*key), std::move(*val));
    }
    else if constexpr (is_std_optional_v<M>)
    {
        auto res = string_to_value<typename _optional_value_<M>::type>(s);
        if (!res) return std::unexpected(res.error());
        dst = std::move(*res);
    }
    else
    {
        auto res = string_to_value<M>(s);
        if (!res) return std::unexpected(res.error());
        dst = std::move(*res);
    }
    return {};
}

// -----------------------------------------------------------------------------
// OPTIONS & DESCRIPTORS
// -----------------------------------------------------------------------------

inline constexpr uint16_t F_REQUIRED   = 1 << 0;
inline constexpr uint16_t F_HIDDEN     = 1 << 1;
inline constexpr uint16_t F_POSITIONAL = 1 << 2;
inline constexpr uint16_t F_SEPARATE   = 1 << 3;

template <typename M>
struct Opt
{
    std::array<std::string, 2> args;   // { long, short }
    std::string desc{};
    std::optional<M> default_val_{};
    uint16_t flags_ = 0;
    std::string meta_{};
    std::string env_{};

    auto flags(uint16_t f) -> Opt<M>&
    {
        flags_ |= f;
        return *this;
    }

    auto required()   -> Opt<M>& { return flags(F_REQUIRED); }
    auto hidden()     -> Opt<M>& { return flags(F_HIDDEN); }
    auto positional() -> Opt<M>& { return flags(F_POSITIONAL); }
    auto separate()   -> Opt<M>& { return flags(F_SEPARATE); }

    auto deflt(M x) -> Opt<M>&
    {
        default_val_ = std::move(x);
        return *this;
    }

    auto help(const std::string& s) -> Opt<M>&
    {
        desc = s;
        return *this;
    }

    auto meta(const std::string& s) -> Opt<M>&
    {
        meta_ = s;
        return *this;
    }

    auto env(const std::string& s) -> Opt<M>&
    {
        env_ = s;
        return *this;
    }
};

struct Cmd
{
    std::string name{};
    std::string help{};
};

enum Field_kind : uint8_t { Scalar, Flag, Multi, Positional, Positional_multi };

using Field_id = uint32_t;
using Binder   = std::function<std::expected<void, std::string>(void*, std::string_view)>;
using Mutator  = std::function<void(void*)>;

// One leaf of a configuration level. Binders receive the level's destination
// object and reach the member through the field's path.
struct Field
{
    Field_id id;
    std::vector<std::string_view> path;
    Field_kind kind;
    std::string_view long_name;
    std::string_view short_alias;
    std::string_view help;
    std::string_view meta;
    std::string_view env;
    std::string type_name;
    uint16_t flags;
    bool has_default;
    std::string default_text;

    Binder assign;
    Mutator clear;
    Mutator apply_default;

    [[nodiscard]] auto is_positional() const -> bool { return kind == Positional || kind == Positional_multi; }
    [[nodiscard]] auto is_multi() const -> bool { return kind == Multi || kind == Positional_multi; }
    [[nodiscard]] auto takes_value() const -> bool { return kind != Flag; }
    [[nodiscard]] auto required() const -> bool { return (flags & F_REQUIRED) || kind == Positional; }

    [[nodiscard]]
    auto display_name() const -> std::string
    {
        if (is_positional())      return std::string(meta);
        if (!long_name.empty())   return "--" + std::string(long_name);
        return "-" + std::string(short_alias);
    }
};

struct Level;

struct Subcommand
{
    std::string_view name;
    std::string_view help;
    std::function<void*(void*)> select;   // emplaces the alternative, returns the child destination
    Level* level;
};

// The descriptor set of one configuration level: the root or one subcommand.
struct Level
{
    std::string_view name;
    std::string_view description;
    const Level* parent = nullptr;
    std::vector<Field*> fields;
    std::vector<Subcommand*> subcommands;
    std::unordered_map<std::string_view, Field*> long_to_field;
    std::unordered_map<char, Field*> short_to_field;
    const Field* multi_positional = nullptr;
    bool subcommand_required = false;

    [[nodiscard]]
    auto find_long(std::string_view name) const -> const Field*
    {
        auto it = long_to_field.find(name);
        return it == long_to_field.end() ? nullptr : it->second;
    }

    [[nodiscard]]
    auto find_short(char c) const -> const Field*
    {
        auto it = short_to_field.find(c);
        return it == short_to_field.end() ? nullptr : it->second;
    }

    [[nodiscard]]
    auto find_subcommand(std::string_view name) const -> const Subcommand*
    {
        for (const auto* s : subcommands)
            if (s->name == name) return s;
        return nullptr;
    }

    auto apply_defaults(void* dest) const -> void
    {
        for (const auto* f : fields)
            if (f->apply_default) f->apply_default(dest);
    }
};

inline auto operator<<(std::ostream& os, Field_kind k) -> std::ostream&
{
    switch (k) {
        case Field_kind::Scalar:           return os << "Scalar";
        case Field_kind::Flag:             return os << "Flag";
        case Field_kind::Multi:            return os << "Multi";
        case Field_kind::Positional:       return os << "Positional";
        case Field_kind::Positional_multi: return os << "Positional_multi";
    }
    return os << "unknown";
}

inline auto operator<<(std::ostream& os, Error_kind k) -> std::ostream&
{
    switch (k) {
        case Error_kind::Unknown_flag:         return os << "Unknown_flag";
        case Error_kind::Conversion:           return os << "Conversion";
        case Error_kind::Missing_required:     return os << "Missing_required";
        case Error_kind::Ambiguous_subcommand: return os << "Ambiguous_subcommand";
        case Error_kind::Missing_value:        return os << "Missing_value";
        case Error_kind::Repeated_option:      return os << "Repeated_option";
    }
    return os << "unknown";
}

inline auto operator<<(std::ostream& os, const Field& f) -> std::ostream&
{
    os << "Field{ id=" << f.id << ", kind=" << f.kind << ", name=" << f.display_name()
       << ", type=" << f.type_name << ", flags=0b";
    for (int bit = 3; bit >= 0; --bit) os << ((f.flags >> bit) & 1);
    return os << " }";
}

inline auto operator<<(std::ostream& os, const Error& e) -> std::ostream&
{
    return os << e.message;
}

// -----------------------------------------------------------------------------
// COMMAND BUILDER
// -----------------------------------------------------------------------------

template <typename T>
class Parser;

// Declares the fields of one configuration struct. Groups share the level of
// the command that created them, subcommands get a level of their own.
template <typename T>
class Command
{
    template <typename> friend class Command;
    template <typename> friend class Parser;

    using Locator = std::function<T*(void*)>;

    Arena* arena_;
    Level* level_;
    Locator locate_;
    std::vector<std::string_view> path_;

    Command(Arena& arena, Level& level, Locator locate, std::vector<std::string_view> path)
    : arena_(&arena), level_(&level), locate_(std::move(locate)), path_(std::move(path))
    {}

public:
    template <typename M>
    requires Bindable_C<M>
    auto add(M T::*member, std::type_identity_t<Opt<M>> opt, std::source_location loc = std::source_location::current()) -> Command<T>&
    {
        add_field(member, {}, std::move(opt), loc);
        return *this;
    }

    template <typename M>
    requires Bindable_C<M>
    auto add(M T::*member, Field_name name, std::type_identity_t<Opt<M>> opt = {},
             std::source_location loc = std::source_location::current()) -> Command<T>&
    {
        add_field(member, name.spelled, std::move(opt), loc);
        return *this;
    }

    template <typename S, typename M>
    auto subcommand(M T::*member, Cmd info, std::type_identity_t<std::function<void(Command<S>&)>> describe,
                    std::source_location loc = std::source_location::current()) -> Command<T>&
    {
        add_subcommand<S>(member, std::move(info), describe, loc);
        return *this;
    }

    template <typename S, typename M>
    auto subcommand(M T::*member, Field_name name, Cmd info, std::type_identity_t<std::function<void(Command<S>&)>> describe,
                    std::source_location loc = std::source_location::current()) -> Command<T>&
    {
        if (info.name.empty()) info.name = to_kebab(name.spelled);
        add_subcommand<S>(member, std::move(info), describe, loc);
        return *this;
    }

    // Embeds the fields of a nested struct into this level
    template <typename S>
    auto group(S T::*member, Field_name name, std::type_identity_t<std::function<void(Command<S>&)>> describe) -> Command<T>&
    {
        auto outer = locate_;
        auto path = path_;
        path.push_back(arena_->str(name.spelled));
        ARGOT_DEBUG_L2("Group: Embedding '", name.spelled, "'");

        Command<S> nested(*arena_, *level_, [outer, member](void* root) -> S* { return &(outer(root)->*member); }, std::move(path));
        describe(nested);
        return *this;
    }

    auto about(const std::string& text) -> Command<T>&
    {
        level_->description = arena_->str(text);
        return *this;
    }

    auto require_subcommand() -> Command<T>&
    {
        level_->subcommand_required = true;
        return *this;
    }

private:
    template <typename M>
    auto add_field(M T::*member, std::string_view spelled, Opt<M> opt, std::source_location loc) -> void;

    template <typename S, typename M>
    auto add_subcommand(M T::*member, Cmd info, const std::function<void(Command<S>&)>& describe, std::source_location loc) -> void;
};

template <typename M>
constexpr auto member_kind(bool positional) -> Field_kind
{
    constexpr bool multi = is_std_vector_v<M> || is_std_map_v<M>;
    if (positional) return multi ? Field_kind::Positional_multi : Field_kind::Positional;
    if constexpr (std::is_same_v<M, bool> || std::is_same_v<M, std::optional<bool>>) return Field_kind::Flag;
    return multi ? Field_kind::Multi : Field_kind::Scalar;
}

template <typename T>
template <typename M>
auto Command<T>::add_field(M T::*member, std::string_view spelled, Opt<M> opt, std::source_location loc) -> void
{
    ARGOT_DEBUG_L1("Add: Registering Field [long='", opt.args[0], "', short='", opt.args[1], "', spelled='", spelled, "']");

    const bool positional = opt.flags_ & F_POSITIONAL;
    const Field_kind kind = member_kind<M>(positional);

    std::string long_name = opt.args[0].empty() ? to_kebab(spelled) : opt.args[0];
    const std::string& short_name = opt.args[1];

    // 1. Shape checks
    if (positional)
    {
        if (long_name.empty()) throw Shape_error("positional field needs a name", loc);
        if (!short_name.empty()) throw Shape_error("positional '" + long_name + "' cannot have a short alias", loc);
        if (opt.flags_ & F_SEPARATE) throw Shape_error("positional '" + long_name + "' cannot be separate", loc);
        if (level_->multi_positional)
        {
            if (kind == Field_kind::Positional_multi)
                throw Shape_error("more than one multi-value positional: '" + long_name + "'", loc);
            throw Shape_error("positional '" + long_name + "' declared after multi-value positional '" +
                              std::string(level_->multi_positional->long_name) + "'", loc);
        }
        if (kind == Field_kind::Positional && opt.default_val_)
            throw Shape_error("positional '" + long_name + "' is always required and cannot have a default", loc);
    }
    else
    {
        if (long_name.empty() && short_name.empty()) throw Shape_error("option needs a long name or a short alias", loc);
        if (!long_name.empty() && long_name.size() < 2) throw Shape_error("long option '" + long_name + "' must be > 1 char", loc);
        if (!short_name.empty() && short_name.size() != 1) throw Shape_error("short option '" + short_name + "' must be 1 char", loc);
        if (long_name == "help" || short_name == "h") throw Shape_error("'--help' and '-h' are reserved", loc);
        if (level_->find_long(long_name)) throw Shape_error("duplicate option: --" + long_name, loc);
        if (!short_name.empty() && level_->find_short(short_name[0])) throw Shape_error("duplicate option: -" + short_name, loc);
        if ((opt.flags_ & F_SEPARATE) && kind != Field_kind::Multi)
            throw Shape_error("separate applies to multi-value options only: --" + long_name, loc);
    }
    if ((opt.flags_ & F_REQUIRED) && opt.default_val_)
        throw Shape_error("field '" + long_name + "' is required and has a default", loc);

    // 2. Descriptor
    Field* f = arena_->make<Field>();
    f->id = static_cast<Field_id>(level_->fields.size());
    f->path = path_;
    f->path.push_back(arena_->str(spelled.empty() ? std::string_view(long_name) : spelled));
    f->kind = kind;
    f->long_name = arena_->str(long_name);
    f->short_alias = arena_->str(short_name);
    f->help = arena_->str(opt.desc);
    f->meta = arena_->str(opt.meta_.empty() ? to_placeholder(long_name) : opt.meta_);
    f->env = arena_->str(opt.env_);
    f->type_name = member_type_name<M>();
    f->flags = opt.flags_;
    f->has_default = opt.default_val_.has_value();
    f->default_text = opt.default_val_ ? value_to_string(*opt.default_val_) : std::string{};

    // 3. Binders
    auto locate = locate_;
    f->assign = [locate, member](void* root, std::string_view s) -> std::expected<void, std::string> {
        ARGOT_DEBUG_L3("Assign: '", s, "'");
        return assign_member(locate(root)->*member, s);
    };
    f->clear = [locate, member](void* root) {
        if constexpr (is_std_vector_v<M> || is_std_map_v<M>) (locate(root)->*member).clear();
    };
    if (opt.default_val_)
    {
        f->apply_default = [locate, member, d = std::move(*opt.default_val_)](void* root) {
            locate(root)->*member = d;
        };
    }

    // 4. Register
    if (positional)
    {
        if (kind == Field_kind::Positional_multi) level_->multi_positional = f;
    }
    else
    {
        if (!f->long_name.empty())   level_->long_to_field.emplace(f->long_name, f);
        if (!f->short_alias.empty()) level_->short_to_field.emplace(f->short_alias[0], f);
    }
    level_->fields.push_back(f);
    ARGOT_DEBUG_L2("  -> ", *f);
}

template <typename T>
template <typename S, typename M>
auto Command<T>::add_subcommand(M T::*member, Cmd info, const std::function<void(Command<S>&)>& describe, std::source_location loc) -> void
{
    static_assert((is_std_variant_v<M> && variant_has_alternative<S, M>::value) || std::is_same_v<M, std::optional<S>>,
                  "subcommand member must be a std::variant holding S or a std::optional<S>");

    ARGOT_DEBUG_L1("Add: Registering Subcommand '", info.name, "'");
    if (info.name.empty()) throw Shape_error("subcommand needs a name", loc);
    if (level_->find_subcommand(info.name)) throw Shape_error("duplicate subcommand: " + info.name, loc);

    Level* child = arena_->make<Level>();
    child->name = arena_->str(info.name);
    child->parent = level_;

    Subcommand* sub = arena_->make<Subcommand>();
    sub->name = child->name;
    sub->help = arena_->str(info.help);
    sub->level = child;

    auto locate = locate_;
    sub->select = [locate, member](void* root) -> void* {
        M& m = locate(root)->*member;
        if constexpr (is_std_variant_v<M>) return &m.template emplace<S>();
        else return &m.emplace();
    };
    level_->subcommands.push_back(sub);

    Command<S> nested(*arena_, *child, [](void* p) -> S* { return static_cast<S*>(p); }, {});
    describe(nested);
}

// -----------------------------------------------------------------------------
// PARSER CONFIG & STREAM
// -----------------------------------------------------------------------------

inline constexpr uint16_t P_SPACE = 1 << 0;
inline constexpr uint16_t P_COMMA = 1 << 1;
inline constexpr uint16_t P_EQUAL = 1 << 2;

enum Repeated_scalar_policy : uint8_t { REJECT, FIRST, LAST };

struct Parser_config
{
    uint8_t value_binding = P_EQUAL | P_SPACE;
    uint8_t multi_style   = 0;                 // P_COMMA splits multi-value tokens on ','

    bool allow_combined_short_flags = true;
    bool allow_short_value_concat   = true;
    bool stop_on_double_dash        = true;

    Repeated_scalar_policy repeated_scalar = Repeated_scalar_policy::LAST;
    char env_separator = ',';

    bool compact_synopsis = false;
    bool use_color        = false;
    std::size_t help_gap  = 4;
};

enum class Token_kind : uint8_t { Long_flag, Short_flag, Positional, Terminator };

inline auto operator<<(std::ostream& os, Token_kind k) -> std::ostream&
{
    switch (k) {
        case Token_kind::Long_flag:  return os << "Long_flag";
        case Token_kind::Short_flag: return os << "Short_flag";
        case Token_kind::Positional: return os << "Positional";
        case Token_kind::Terminator: return os << "Terminator";
    }
    return os << "unknown";
}

struct Token
{
    Token_kind kind;
    std::string_view text;                   // raw token
    std::string_view name{};                 // long name, or the short cluster without its dash
    std::optional<std::string_view> value{}; // inline `=value` of a long flag
    bool after_terminator = false;
};

class Token_stream
{
    std::span<const std::string> args_;
    std::size_t cur_ = 0;
    bool terminated_ = false;
    bool stop_on_double_dash_;

public:
    Token_stream(std::span<const std::string> args, bool stop_on_double_dash)
    : args_(args), stop_on_double_dash_(stop_on_double_dash)
    {}

    [[nodiscard]] bool empty() const { return cur_ >= args_.size(); }
    [[nodiscard]] bool terminated() const { return terminated_; }

    // Raw tokens not consumed yet
    [[nodiscard]]
    std::span<const std::string> rest() const { return args_.subspan(std::min(cur_, args_.size())); }

    [[nodiscard]]
    std::optional<Token> peek() const
    {
        if (empty()) return std::nullopt;
        return classify(args_[cur_]);
    }

    std::optional<Token> next()
    {
        auto tok = peek();
        if (!tok) return std::nullopt;
        ++cur_;
        if (tok->kind == Token_kind::Terminator) terminated_ = true;
        return tok;
    }

    // Consumes the next token only if it is value text
    std::optional<std::string_view> next_value()
    {
        auto tok = peek();
        if (!tok || tok->kind != Token_kind::Positional) return std::nullopt;
        ++cur_;
        return tok->text;
    }

private:
    [[nodiscard]]
    Token classify(std::string_view tok) const
    {
        if (terminated_)
            return Token{ .kind = Token_kind::Positional, .text = tok, .after_terminator = true };

        if (tok == "--" && stop_on_double_dash_)
            return Token{ .kind = Token_kind::Terminator, .text = tok };

        if (tok.starts_with("--") && tok.size() > 2)
        {
            std::string_view body = tok.substr(2);
            if (auto eq = body.find('='); eq != std::string_view::npos)
                return Token{ .kind = Token_kind::Long_flag, .text = tok, .name = body.substr(0, eq), .value = body.substr(eq + 1) };
            return Token{ .kind = Token_kind::Long_flag, .text = tok, .name = body };
        }

        if (tok.starts_with("-") && tok.size() > 1 && !looks_numeric(tok))
            return Token{ .kind = Token_kind::Short_flag, .text = tok, .name = tok.substr(1) };

        return Token{ .kind = Token_kind::Positional, .text = tok };
    }
};

// -----------------------------------------------------------------------------
// MATCHER
// -----------------------------------------------------------------------------

using Environment = std::unordered_map<std::string, std::string>;

[[nodiscard]]
inline auto environment_from_process() -> Environment
{
    Environment env;
    for (char** e = environ; e && *e; ++e)
    {
        std::string_view entry = *e;
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) continue;
        env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return env;
}

struct Parse_result
{
    std::vector<std::string> chain;   // selected subcommands, outermost first
    bool help_requested = false;
};

class Matcher
{
    struct Frame
    {
        const Level* level;
        void* dest;
        std::vector<bool> filled;
    };

    struct Hit
    {
        Frame* frame = nullptr;
        const Field* field = nullptr;
    };

    enum class Step : uint8_t { Next, Help };

    const Parser_config& cfg_;
    Token_stream tokens_;
    std::vector<Frame> frames_;
    std::vector<std::string> chain_;

public:
    Matcher(const Level& root, void* dest, const Parser_config& cfg, std::span<const std::string> args)
    : cfg_(cfg), tokens_(args, cfg.stop_on_double_dash)
    {
        frames_.push_back(Frame{ &root, dest, std::vector<bool>(root.fields.size(), false) });
    }

    auto run(const Environment& env) -> std::expected<Parse_result, Error>
    {
        frames_.back().level->apply_defaults(frames_.back().dest);

        while (auto tok = tokens_.next())
        {
            ARGOT_DEBUG_L2("ParseLoop: Processing Token '", tok->text, "' as ", tok->kind);
            std::expected<Step, Error> step;
            switch (tok->kind)
            {
                case Token_kind::Terminator: continue;
                case Token_kind::Long_flag:  step = bind_long(*tok); break;
                case Token_kind::Short_flag: step = bind_short(*tok); break;
                case Token_kind::Positional: step = bind_positional(*tok); break;
            }
            if (!step)
            {
                if (help_ahead())
                {
                    ARGOT_DEBUG_L1("Parse: Help requested after failure (", step.error().kind, ")");
                    return Parse_result{ chain_, true };
                }
                return std::unexpected(std::move(step.error()));
            }
            if (*step == Step::Help)
            {
                ARGOT_DEBUG_L1("Parse: Help requested at depth ", chain_.size());
                return Parse_result{ chain_, true };
            }
        }

        ARGOT_DEBUG_L1("Parse: Resolving environment and defaults");
        if (auto r = resolve_environment(env); !r) return std::unexpected(std::move(r.error()));
        if (auto r = check_required(); !r) return std::unexpected(std::move(r.error()));

        ARGOT_DEBUG_L1("Parse: Success");
        return Parse_result{ chain_, false };
    }

private:
    [[nodiscard]]
    auto fail(Error_kind kind, std::string message, std::string name = {}, std::string literal = {},
              std::string type = {}) const -> std::unexpected<Error>
    {
        ARGOT_DEBUG_L1("Parse: Failed (", kind, "): ", message);
        return std::unexpected(Error{ kind, std::move(message), std::move(name), std::move(literal), std::move(type), chain_ });
    }

    auto find_long(std::string_view name) -> Hit
    {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
            if (const Field* f = it->level->find_long(name)) return Hit{ &*it, f };
        return {};
    }

    auto find_short(char c) -> Hit
    {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
            if (const Field* f = it->level->find_short(c)) return Hit{ &*it, f };
        return {};
    }

    // A help request before `--` wins over a failure earlier on the line
    auto help_ahead() -> bool
    {
        if (tokens_.terminated()) return false;
        for (const std::string& raw : tokens_.rest())
        {
            std::string_view t = raw;
            if (t == "--" && cfg_.stop_on_double_dash) return false;
            if (t == "--help" || t.starts_with("--help=")) return true;
            if (t.size() < 2 || t[0] != '-' || t[1] == '-' || looks_numeric(t)) continue;
            if (!cfg_.allow_combined_short_flags)
            {
                if (t == "-h") return true;
                continue;
            }

            // Walk the cluster the way bind_short would, up to a value-taking alias
            for (char c : t.substr(1))
            {
                if (c == 'h') return true;
                const Field* f = find_short(c).field;
                if (!f || f->takes_value()) break;
            }
        }
        return false;
    }

    auto take_value() -> std::optional<std::string_view>
    {
        if (!(cfg_.value_binding & P_SPACE)) return std::nullopt;
        return tokens_.next_value();
    }

    // First binding of a multi-value field in this parse discards its default
    auto mark(Frame& frame, const Field& field) -> void
    {
        if (field.is_multi() && !frame.filled[field.id])
        {
            ARGOT_DEBUG_L3("  -> Clearing pre-populated values of ", field.display_name());
            field.clear(frame.dest);
        }
        frame.filled[field.id] = true;
    }

    auto convert(Frame& frame, const Field& field, const std::string& shown, std::string_view literal)
        -> std::expected<void, Error>
    {
        auto res = field.assign(frame.dest, literal);
        if (!res)
            return fail(Error_kind::Conversion,
                        "error processing " + shown + ": cannot parse \"" + std::string(literal) + "\" as " + field.type_name + ": " + res.error(),
                        shown, std::string(literal), field.type_name);
        return {};
    }

    auto store(Frame& frame, const Field& field, const std::string& shown, std::string_view literal)
        -> std::expected<void, Error>
    {
        mark(frame, field);
        if (field.is_multi() && (cfg_.multi_style & P_COMMA))
        {
            std::size_t start = 0;
            while (true)
            {
                auto comma = literal.find(',', start);
                auto piece = literal.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
                if (auto r = convert(frame, field, shown, piece); !r) return r;
                if (comma == std::string_view::npos) break;
                start = comma + 1;
            }
            return {};
        }
        return convert(frame, field, shown, literal);
    }

    auto bind_option(Frame& frame, const Field& field, const std::string& shown, std::optional<std::string_view> inline_value)
        -> std::expected<Step, Error>
    {
        ARGOT_DEBUG_L2("  -> Matched ", shown, " ", field);
        switch (field.kind)
        {
            case Field_kind::Flag:
            {
                if (auto r = store(frame, field, shown, inline_value.value_or("true")); !r) return std::unexpected(std::move(r.error()));
                return Step::Next;
            }
            case Field_kind::Scalar:
            {
                auto literal = inline_value ? inline_value : take_value();
                if (!literal) return fail(Error_kind::Missing_value, "missing value for " + shown, shown);
                if (frame.filled[field.id])
                {
                    if (cfg_.repeated_scalar == Repeated_scalar_policy::REJECT)
                        return fail(Error_kind::Repeated_option, shown + " given more than once", shown, std::string(*literal));
                    if (cfg_.repeated_scalar == Repeated_scalar_policy::FIRST)
                    {
                        ARGOT_DEBUG_L3("     -> Keeping first value, dropping '", *literal, "'");
                        return Step::Next;
                    }
                }
                if (auto r = store(frame, field, shown, *literal); !r) return std::unexpected(std::move(r.error()));
                return Step::Next;
            }
            case Field_kind::Multi:
            {
                std::vector<std::string_view> literals;
                if (inline_value)
                    literals.push_back(*inline_value);
                else if (field.flags & F_SEPARATE)
                {
                    auto v = take_value();
                    if (!v) return fail(Error_kind::Missing_value, "missing value for " + shown, shown);
                    literals.push_back(*v);
                }
                else
                    while (auto v = take_value()) literals.push_back(*v);

                ARGOT_DEBUG_L3("     -> Collected ", literals.size(), " value(s)");
                mark(frame, field);
                for (auto lit : literals)
                    if (auto r = store(frame, field, shown, lit); !r) return std::unexpected(std::move(r.error()));
                return Step::Next;
            }
            case Field_kind::Positional:
            case Field_kind::Positional_multi:
                break;
        }
        return fail(Error_kind::Unknown_flag, "unknown argument " + shown, shown);
    }

    auto bind_long(const Token& tok) -> std::expected<Step, Error>
    {
        if (tok.name == "help") return Step::Help;

        std::string shown = "--" + std::string(tok.name);
        Hit hit = find_long(tok.name);
        if (!hit.field) return fail(Error_kind::Unknown_flag, "unknown argument " + shown, shown, std::string(tok.text));

        if (tok.value && !(cfg_.value_binding & P_EQUAL))
            return fail(Error_kind::Missing_value, shown + " does not accept '=' values", shown, std::string(tok.text));

        return bind_option(*hit.frame, *hit.field, shown, tok.value);
    }

    // -abc expands left to right. The first value-taking alias ends the cluster
    // and takes the remainder (`-O5`, `-O=5`) or the next value token.
    auto bind_short(const Token& tok) -> std::expected<Step, Error>
    {
        std::string_view body = tok.name;
        for (std::size_t i = 0; i < body.size(); ++i)
        {
            char c = body[i];
            std::string shown = std::string("-") + c;
            std::string_view rest = body.substr(i + 1);

            if (c == 'h') return Step::Help;

            Hit hit = find_short(c);
            if (!hit.field) return fail(Error_kind::Unknown_flag, "unknown argument " + shown, shown, std::string(tok.text));

            if (!hit.field->takes_value())
            {
                if (rest.starts_with('='))
                    return bind_option(*hit.frame, *hit.field, shown, rest.substr(1));
                if (auto r = bind_option(*hit.frame, *hit.field, shown, std::nullopt); !r) return r;
                if (!rest.empty() && !cfg_.allow_combined_short_flags)
                    return fail(Error_kind::Unknown_flag, "unknown argument " + std::string(tok.text), std::string(tok.text), std::string(tok.text));
                continue;
            }

            if (rest.empty()) return bind_option(*hit.frame, *hit.field, shown, std::nullopt);
            if (rest.starts_with('=')) return bind_option(*hit.frame, *hit.field, shown, rest.substr(1));
            if (!cfg_.allow_short_value_concat)
                return fail(Error_kind::Missing_value, shown + " needs its value as a separate argument", shown, std::string(tok.text));
            return bind_option(*hit.frame, *hit.field, shown, rest);
        }
        return Step::Next;
    }

    auto bind_positional(const Token& tok) -> std::expected<Step, Error>
    {
        Frame& frame = frames_.back();
        const Level& level = *frame.level;

        for (const Field* f : level.fields)
        {
            if (f->kind != Field_kind::Positional || frame.filled[f->id]) continue;
            ARGOT_DEBUG_L3("  -> Positional '", tok.text, "' fills ", f->meta);
            if (auto r = store(frame, *f, std::string(f->meta), tok.text); !r) return std::unexpected(std::move(r.error()));
            return Step::Next;
        }

        if (!tok.after_terminator)
        {
            if (const Subcommand* sub = level.find_subcommand(tok.text))
            {
                descend(frame, *sub);
                return Step::Next;
            }
        }

        if (const Field* multi = level.multi_positional)
        {
            ARGOT_DEBUG_L3("  -> Positional '", tok.text, "' appended to ", multi->meta);
            if (auto r = store(frame, *multi, std::string(multi->meta), tok.text); !r) return std::unexpected(std::move(r.error()));
            return Step::Next;
        }

        if (!level.subcommands.empty())
            return fail(Error_kind::Ambiguous_subcommand, "invalid subcommand: " + std::string(tok.text), {}, std::string(tok.text));
        return fail(Error_kind::Ambiguous_subcommand, "too many positional arguments at '" + std::string(tok.text) + "'", {}, std::string(tok.text));
    }

    auto descend(Frame& parent, const Subcommand& sub) -> void
    {
        ARGOT_DEBUG_L2("  -> Entering subcommand '", sub.name, "'");
        void* child = sub.select(parent.dest);
        sub.level->apply_defaults(child);
        chain_.emplace_back(sub.name);
        frames_.push_back(Frame{ sub.level, child, std::vector<bool>(sub.level->fields.size(), false) });
    }

    auto resolve_environment(const Environment& env) -> std::expected<void, Error>
    {
        for (auto& frame : frames_)
        {
            for (const Field* f : frame.level->fields)
            {
                if (frame.filled[f->id] || f->env.empty()) continue;
                auto it = env.find(std::string(f->env));
                if (it == env.end()) continue;

                ARGOT_DEBUG_L2("  -> ", f->display_name(), " from environment variable ", f->env);
                std::string shown = "environment variable " + std::string(f->env);
                mark(frame, *f);
                if (!f->is_multi())
                {
                    if (auto r = convert(frame, *f, shown, it->second); !r) return r;
                    continue;
                }

                std::string_view text = it->second;
                std::size_t start = 0;
                while (start <= text.size() && !text.empty())
                {
                    auto sep = text.find(cfg_.env_separator, start);
                    auto piece = text.substr(start, sep == std::string_view::npos ? std::string_view::npos : sep - start);
                    if (auto r = convert(frame, *f, shown, piece); !r) return r;
                    if (sep == std::string_view::npos) break;
                    start = sep + 1;
                }
            }
        }
        return {};
    }

    auto check_required() -> std::expected<void, Error>
    {
        for (auto& frame : frames_)
        {
            for (const Field* f : frame.level->fields)
            {
                if (frame.filled[f->id] || !f->required()) continue;
                std::string shown = f->display_name();
                std::string message = shown + " is required";
                if (!f->env.empty()) message += " (or environment variable " + std::string(f->env) + ")";
                return fail(Error_kind::Missing_required, message, shown);
            }
        }

        const Level& last = *frames_.back().level;
        if (last.subcommand_required && !last.subcommands.empty())
            return fail(Error_kind::Missing_required, "a subcommand is required");
        return {};
    }
};

// -----------------------------------------------------------------------------
// FORMATTER
// -----------------------------------------------------------------------------

class Formatter
{
    const Level& root_;
    std::string program_;
    const Parser_config& cfg_;

public:
    Formatter(const Level& root, std::string program, const Parser_config& cfg)
    : root_(root), program_(std::move(program)), cfg_(cfg)
    {}

    // Follows the chain as far as it names known subcommands
    [[nodiscard]]
    auto resolve(const std::vector<std::string>& chain) const -> const Level&
    {
        const Level* level = &root_;
        for (const auto& name : chain)
        {
            const Subcommand* sub = level->find_subcommand(name);
            if (!sub) break;
            level = sub->level;
        }
        return *level;
    }

    [[nodiscard]]
    auto synopsis(const std::vector<std::string>& chain) const -> std::string
    {
        const Level& level = resolve(chain);
        std::string out = program_;
        for (const auto& name : chain) out += " " + name;

        bool any_option = false;
        for (const Field* f : level.fields)
        {
            if (f->is_positional() || (f->flags & F_HIDDEN)) continue;
            if (cfg_.compact_synopsis)
            {
                any_option = true;
                continue;
            }
            std::string part = f->long_name.empty() ? "-" + std::string(f->short_alias) : "--" + std::string(f->long_name);
            if (f->takes_value()) part += " " + std::string(f->meta);
            if (f->kind == Field_kind::Multi && !(f->flags & F_SEPARATE)) part += " [" + std::string(f->meta) + " ...]";
            out += (f->flags & F_REQUIRED) ? " " + part : " [" + part + "]";
        }
        if (any_option) out += " [options]";

        for (const Field* f : level.fields)
        {
            if (!f->is_positional() || (f->flags & F_HIDDEN)) continue;
            std::string meta(f->meta);
            if (f->kind == Field_kind::Positional)
                out += " " + meta;
            else if (f->flags & F_REQUIRED)
                out += " " + meta + " [" + meta + " ...]";
            else
                out += " [" + meta + " [" + meta + " ...]]";
        }
        return out;
    }

    auto write_usage(std::ostream& os, const std::vector<std::string>& chain) const -> void
    {
        os << heading("Usage:") << " " << synopsis(chain) << "\n";
    }

    auto write_help(std::ostream& os, const std::vector<std::string>& chain) const -> void
    {
        ARGOT_DEBUG_L1("Help: Generating Usage Info");
        const Level& level = resolve(chain);
        write_usage(os, chain);
        if (!level.description.empty())
            os << "\n" << level.description << "\n";

        struct Row
        {
            std::string left;
            std::string text;
        };
        std::vector<Row> positionals, options, commands;

        for (const Field* f : level.fields)
        {
            if (f->flags & F_HIDDEN) continue;
            if (f->is_positional()) positionals.push_back(Row{ std::string(f->meta), describe(*f) });
            else                    options.push_back(Row{ option_left(*f), describe(*f) });
        }
        options.push_back(Row{ "--help, -h", "display this help and exit" });
        for (const Subcommand* s : level.subcommands)
            commands.push_back(Row{ std::string(s->name), std::string(s->help) });

        std::size_t max_width = 0;
        for (const auto* rows : { &positionals, &options, &commands })
            for (const auto& r : *rows)
                max_width = std::max(max_width, r.left.size());
        max_width += cfg_.help_gap;

        auto section = [&](std::string_view title, const std::vector<Row>& rows) {
            if (rows.empty()) return;
            os << "\n" << heading(title) << "\n";
            for (const auto& r : rows)
            {
                if (r.text.empty()) os << "  " << r.left << "\n";
                else os << "  " << std::left << std::setw(static_cast<int>(max_width)) << r.left << r.text << "\n";
            }
        };

        section("Positional arguments:", positionals);
        section("Options:", options);
        section("Commands:", commands);
    }

    auto write_error(std::ostream& os, const Error& err) const -> void
    {
        write_usage(os, err.chain);
        os << "error: " << err.message << "\n";
    }

private:
    [[nodiscard]]
    auto heading(std::string_view title) const -> std::string
    {
        if (!cfg_.use_color) return std::string(title);
        return "\033[1m" + std::string(title) + "\033[0m";
    }

    [[nodiscard]]
    static auto option_left(const Field& f) -> std::string
    {
        std::string left;
        std::string value = f.takes_value() ? " " + std::string(f.meta) : std::string{};
        if (!f.long_name.empty())
        {
            left += "--" + std::string(f.long_name) + value;
            if (f.kind == Field_kind::Multi && !(f.flags & F_SEPARATE)) left += " [" + std::string(f.meta) + " ...]";
        }
        if (!f.short_alias.empty())
        {
            if (!left.empty()) left += ", ";
            left += "-" + std::string(f.short_alias) + value;
        }
        return left;
    }

    [[nodiscard]]
    static auto describe(const Field& f) -> std::string
    {
        std::string notes;
        auto note = [&](const std::string& s) {
            if (!notes.empty()) notes += ", ";
            notes += s;
        };
        if ((f.flags & F_REQUIRED) && !f.is_positional()) note("required");
        if (f.has_default && !f.default_text.empty())    note("default: " + f.default_text);
        if (!f.env.empty())                              note("env: " + std::string(f.env));

        std::string text(f.help);
        if (!notes.empty())
        {
            if (!text.empty()) text += " ";
            text += "[" + notes + "]";
        }
        return text;
    }
};

// -----------------------------------------------------------------------------
// PARSER
// -----------------------------------------------------------------------------

// Output sinks and the process-termination hook used by must_parse
struct Terminal
{
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
    std::function<void(int)> exit = [](int code) { std::exit(code); };
};

template <typename T>
class Parser
{
    Arena arena_;
    std::string name_;
    Terminal terminal_;
    Level* root_;

public:
    Parser_config cfg_;

    Parser(std::string name, std::type_identity_t<std::function<void(Command<T>&)>> describe,
           Parser_config cfg = {}, Terminal terminal = {})
    : arena_(), name_(std::move(name)), terminal_(std::move(terminal)), root_(arena_.make<Level>()), cfg_(cfg)
    {
        ARGOT_DEBUG_L1("Parser: Building descriptors for '", name_, "'");
        root_->name = arena_.str(name_);
        Command<T> cmd(arena_, *root_, [](void* p) -> T* { return static_cast<T*>(p); }, {});
        describe(cmd);
    }

    auto parse(T& dest, const std::vector<std::string>& args, const Environment& env = {}) const
        -> std::expected<Parse_result, Error>
    {
        ARGOT_DEBUG_L1("Parse: Start (", args.size(), " tokens)");
        Matcher matcher(*root_, &dest, cfg_, args);
        return matcher.run(env);
    }

    // Prints help or usage + error through the terminal and terminates on
    // anything but a successful parse
    auto must_parse(T& dest, const std::vector<std::string>& args, const Environment& env) const
        -> std::expected<Parse_result, Error>
    {
        return finish(parse(dest, args, env), name_);
    }

    auto must_parse(T& dest, int argc, char* argv[]) const -> std::expected<Parse_result, Error>
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        std::string program = name_;
        if (program.empty() && argc > 0) program = std::filesystem::path(argv[0]).filename().string();
        return finish(parse(dest, args, environment_from_process()), program);
    }

    auto print_usage(std::ostream& os = std::cout, const std::vector<std::string>& chain = {}) const -> void
    {
        formatter(name_).write_usage(os, chain);
    }

    auto print_help(std::ostream& os = std::cout, const std::vector<std::string>& chain = {}) const -> void
    {
        formatter(name_).write_help(os, chain);
    }

    auto print_error(std::ostream& os, const Error& err) const -> void
    {
        formatter(name_).write_error(os, err);
    }

    [[nodiscard]]
    auto formatter(std::string program) const -> Formatter { return Formatter(*root_, std::move(program), cfg_); }

    [[nodiscard]]
    auto root() const -> const Level& { return *root_; }

private:
    auto finish(std::expected<Parse_result, Error> res, const std::string& program) const
        -> std::expected<Parse_result, Error>
    {
        Formatter fmt = formatter(program);
        if (!res)
        {
            fmt.write_error(*terminal_.err, res.error());
            terminal_.exit(EXIT_FAILURE);
        }
        else if (res->help_requested)
        {
            fmt.write_help(*terminal_.out, res->chain);
            terminal_.exit(EXIT_SUCCESS);
        }
        return res;
    }
};

} // namespace argot

#endif // !__ARGOT_HPP_
