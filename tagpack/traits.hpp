#pragma once

#include "tagpack/types.hpp"

#include <chrono>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace tagpack
{
	class Value;

	/* Field
	 *
	 * Name and member pointer of one record field. A record lists its fields,
	 * in declaration order, from a static fields() function:
	 *
	 *     struct Point
	 *     {
	 *         int32_t x=0;
	 *         int32_t y=0;
	 *         static constexpr auto fields()
	 *         {
	 *             return std::make_tuple(tagpack::field("x",&Point::x),tagpack::field("y",&Point::y));
	 *         }
	 *     };
	 */
	template<typename C,typename M>
	struct Field
	{
		using record_type=C;
		using member_type=M;

		std::string_view name;
		M C::*member;
	};

	template<typename C,typename M>
	constexpr Field<C,M> field(std::string_view name,M C::*member)
	{
		return Field<C,M>{name,member};
	}

	namespace detail
	{
		template<typename T>
		struct is_optional : std::false_type {};
		template<typename T>
		struct is_optional<std::optional<T>> : std::true_type {};

		template<typename T>
		struct is_owning_pointer : std::false_type {};
		template<typename T,typename D>
		struct is_owning_pointer<std::unique_ptr<T,D>> : std::true_type {};
		template<typename T>
		struct is_owning_pointer<std::shared_ptr<T>> : std::true_type {};

		template<typename T>
		struct is_unique_pointer : std::false_type {};
		template<typename T,typename D>
		struct is_unique_pointer<std::unique_ptr<T,D>> : std::true_type {};

		template<typename T>
		struct is_system_time_point : std::false_type {};
		template<typename D>
		struct is_system_time_point<std::chrono::time_point<std::chrono::system_clock,D>> : std::true_type {};

		template<typename T>
		struct is_tuple : std::false_type {};
		template<typename... Ts>
		struct is_tuple<std::tuple<Ts...>> : std::true_type {};

		template<typename T>
		inline constexpr bool dependent_false=false;
	}

	template<typename T>
	concept Record=requires
	{
		T::fields();
		requires detail::is_tuple<std::remove_cvref_t<decltype(T::fields())>>::value;
	};

	template<typename T>
	concept Integer=std::integral<T> && !std::same_as<T,bool>;

	template<typename T>
	concept Text=std::convertible_to<const T&,std::string_view> && !std::same_as<T,std::nullptr_t>;

	template<typename T>
	concept Optional=detail::is_optional<T>::value;

	template<typename T>
	concept OwningPointer=detail::is_owning_pointer<T>::value;

	template<typename T>
	concept RawPointer=std::is_pointer_v<T> && !Text<T>;

	template<typename T>
	concept Timestamp=detail::is_system_time_point<T>::value;

	template<typename T>
	concept Mapping=requires(T &m)
	{
		typename T::key_type;
		typename T::mapped_type;
		m.begin();
		m.end();
		m.clear();
	};

	template<typename T>
	concept Sequence=requires(T &s,typename T::value_type v)
	{
		typename T::value_type;
		s.begin();
		s.end();
		s.clear();
		s.push_back(std::move(v));
	} && !Text<T> && !std::same_as<T,binary> && !Mapping<T>;

	// Sequences that can be pre-sized from a decoded length prefix.
	template<typename T>
	concept Reservable=requires(T &s,size_t n)
	{
		s.reserve(n);
	};

	// Types that know how to describe themselves as a Value.
	template<typename T>
	concept ValueConvertible=requires(const T &t)
	{
		{ t.to_value() } -> std::convertible_to<Value>;
	};

} // namespace tagpack
