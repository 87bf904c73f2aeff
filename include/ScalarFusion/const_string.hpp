#pragma once
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <type_traits>

namespace ScalarFusion {

// Compile-time string usable as a non-type template parameter: field keys,
// variant names, reserved tokens.
template <typename CharT, std::size_t N> struct ConstString
{
    constexpr ConstString(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;

    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
        }
        return true;
    }
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

template<class T>
struct is_const_string : std::false_type {};

template<typename CharT, std::size_t N>
struct is_const_string<ConstString<CharT, N>> : std::true_type {};

} // namespace ScalarFusion
