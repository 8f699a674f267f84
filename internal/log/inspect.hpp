#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace srepl::log {

/*
  Stable, human-readable rendering of arbitrary values for annotations.

  Modelled on Node's util.inspect so that annotations read the same no
  matter which runtime produced them:

    Inspect(std::vector<int>{1, 2})           -> [ 1, 2 ]
    Inspect(std::string("hi"))                -> 'hi'
    Inspect(std::map<std::string, int>{...})  -> Map(1) { 'a' => 1 }

  Output longer than `break_length` is broken one element per line.
  Never throws for supported types; unknown types render as [object].
*/
struct InspectOptions {
  int         depth        = 2;
  std::size_t break_length = 80;
};

namespace detail {

std::string QuoteString(std::string_view text);
std::string FormatDouble(double value);
std::string JoinElements(std::string_view open, const std::vector<std::string>& items, std::string_view close, std::size_t indent,
                         std::size_t break_length);

template <typename T>
inline constexpr bool kIsOptional = false;
template <typename T>
inline constexpr bool kIsOptional<std::optional<T>> = true;

template <typename T>
inline constexpr bool kIsSmartPointer = false;
template <typename T>
inline constexpr bool kIsSmartPointer<std::shared_ptr<T>> = true;
template <typename T, typename D>
inline constexpr bool kIsSmartPointer<std::unique_ptr<T, D>> = true;

template <typename T>
inline constexpr bool kIsTupleLike = false;
template <typename A, typename B>
inline constexpr bool kIsTupleLike<std::pair<A, B>> = true;
template <typename... Ts>
inline constexpr bool kIsTupleLike<std::tuple<Ts...>> = true;

class Inspector {
 public:
  explicit Inspector(InspectOptions options) : options_(options) {
  }

  template <typename T>
  std::string Render(const T& value, int depth, std::size_t indent) {
    using V = std::remove_cv_t<T>;

    if constexpr (std::is_same_v<V, bool>) {
      return value ? "true" : "false";
    } else if constexpr (std::is_same_v<V, std::nullptr_t>) {
      return "null";
    } else if constexpr (std::is_same_v<V, char>) {
      return QuoteString(std::string_view(&value, 1));
    } else if constexpr (std::is_integral_v<V>) {
      return std::to_string(value);
    } else if constexpr (std::is_floating_point_v<V>) {
      return FormatDouble(static_cast<double>(value));
    } else if constexpr (std::is_enum_v<V>) {
      return std::to_string(static_cast<std::underlying_type_t<V>>(value));
    } else if constexpr (std::is_same_v<V, const char*> || std::is_same_v<V, char*>) {
      return value ? QuoteString(std::string_view(value)) : "null";
    } else if constexpr (std::is_convertible_v<const V&, std::string_view>) {
      return QuoteString(std::string_view(value));
    } else if constexpr (kIsOptional<V>) {
      return value ? Render(*value, depth, indent) : "undefined";
    } else if constexpr (std::is_pointer_v<V> || kIsSmartPointer<V>) {
      return RenderPointer(value, depth, indent);
    } else if constexpr (kIsTupleLike<V>) {
      if (depth > options_.depth) {
        return "[Array]";
      }
      std::vector<std::string> items;
      std::apply([&](const auto&... element) { (items.push_back(Render(element, depth + 1, indent + 2)), ...); }, value);
      return JoinElements("[", items, "]", indent, options_.break_length);
    } else if constexpr (requires {
                           typename V::key_type;
                           typename V::mapped_type;
                           value.begin();
                           value.size();
                         }) {
      const std::string prefix = "Map(" + std::to_string(value.size()) + ") {";
      if (depth > options_.depth) {
        return "[Map]";
      }
      std::vector<std::string> items;
      for (const auto& [key, mapped] : value) {
        items.push_back(Render(key, depth + 1, indent + 2) + " => " + Render(mapped, depth + 1, indent + 2));
      }
      return JoinElements(prefix, items, "}", indent, options_.break_length);
    } else if constexpr (requires {
                           typename V::key_type;
                           value.begin();
                           value.size();
                         }) {
      const std::string prefix = "Set(" + std::to_string(value.size()) + ") {";
      if (depth > options_.depth) {
        return "[Set]";
      }
      std::vector<std::string> items;
      for (const auto& element : value) {
        items.push_back(Render(element, depth + 1, indent + 2));
      }
      return JoinElements(prefix, items, "}", indent, options_.break_length);
    } else if constexpr (requires {
                           std::begin(value);
                           std::end(value);
                         }) {
      if (depth > options_.depth) {
        return "[Array]";
      }
      std::vector<std::string> items;
      for (const auto& element : value) {
        items.push_back(Render(element, depth + 1, indent + 2));
      }
      return JoinElements("[", items, "]", indent, options_.break_length);
    } else if constexpr (requires(std::ostream& os) { os << value; }) {
      std::ostringstream out;
      out << value;
      return out.str();
    } else {
      return "[object]";
    }
  }

 private:
  template <typename P>
  std::string RenderPointer(const P& pointer, int depth, std::size_t indent) {
    using Pointee = std::remove_cv_t<std::remove_reference_t<decltype(*pointer)>>;

    if (!pointer) {
      return "null";
    }
    if constexpr (std::is_void_v<Pointee>) {
      return "[pointer]";
    } else if constexpr (std::is_function_v<Pointee>) {
      return "[Function]";
    } else {
      const void* address = static_cast<const void*>(std::addressof(*pointer));
      for (const void* seen : visiting_) {
        if (seen == address) {
          return "[Circular]";
        }
      }
      visiting_.push_back(address);
      auto rendered = Render(*pointer, depth, indent);
      visiting_.pop_back();
      return rendered;
    }
  }

  InspectOptions           options_;
  std::vector<const void*> visiting_;
};

} // namespace detail

template <typename T>
std::string Inspect(const T& value, InspectOptions options = {}) {
  detail::Inspector inspector(options);
  return inspector.Render(value, 0, 0);
}

} // namespace srepl::log
