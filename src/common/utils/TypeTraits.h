#pragma once

#include <optional>
#include <type_traits>
#include <vector>

namespace ostmig {

template <class T, template <class...> class Primary>
struct is_specialization_of : std::false_type {};

template <template <class...> class Primary, class... Args>
struct is_specialization_of<Primary<Args...>, Primary> : std::true_type {};

template <class T, template <class...> class Primary>
inline constexpr bool is_specialization_of_v = is_specialization_of<T, Primary>::value;

template <class T>
inline constexpr bool is_vector_v = is_specialization_of_v<T, std::vector>;

template <class T>
inline constexpr bool is_optional_v = is_specialization_of_v<T, std::optional>;

}  // namespace ostmig
