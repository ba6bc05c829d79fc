#pragma once

#include <type_traits>
#include <vector>

#include <seqmatch/Types.hpp>
#include <seqmatch/Utilities.hpp>

namespace seqmatch {

/**
 * Non-owning view over contiguous elements
 */
template <typename T>
class Slice
{
public:
    using value_type = T;
    using pointer = T*;
    using const_pointer = T const*;
    using reference = T&;
    using const_reference = T const&;
    using iterator = pointer;
    using const_iterator = const_pointer;
    using size_type = uz;

public:
    constexpr Slice() noexcept = default;

    constexpr Slice(pointer p, size_type len) noexcept
        : myData(p)
        , myLength(len)
    {
    }

    constexpr Slice(pointer begin, pointer end) noexcept
        : Slice(begin, static_cast<size_type>(end - begin))
    {
    }

    template <uz N>
    constexpr /*implicit*/ Slice(value_type (&arr)[N]) noexcept
        : Slice(arr, N)
    {
    }

    template <typename U>
    /*implicit*/ Slice(std::vector<U>&&) = delete;

    /*implicit*/ Slice(std::vector<std::remove_const_t<value_type>>& v) noexcept
        : Slice(v.data(), v.size())
    {
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U const*, pointer>>>
    /*implicit*/ Slice(std::vector<U> const& v) noexcept
        : Slice(v.data(), v.size())
    {
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, pointer>>>
    constexpr /*implicit*/ Slice(Slice<U> const& s) noexcept
        : Slice(s.data(), s.size())
    {
    }

    void swap(Slice& s) noexcept
    {
        using seqmatch::swap;
        swap(myData, s.myData);
        swap(myLength, s.myLength);
    }

public:
    constexpr iterator       begin()       noexcept { return myData; }
    constexpr const_iterator begin() const noexcept { return myData; }
    constexpr iterator       end  ()       noexcept { return myData + myLength; }
    constexpr const_iterator end  () const noexcept { return myData + myLength; }

    constexpr bool empty() const noexcept { return myLength == 0; }

    constexpr pointer       data()       noexcept { return myData; }
    constexpr const_pointer data() const noexcept { return myData; }

    constexpr uz card() const noexcept { return myLength; }
    constexpr uz size() const noexcept { return myLength; }

    constexpr reference       operator [] (size_type index)       noexcept { return myData[index]; }
    constexpr const_reference operator [] (size_type index) const noexcept { return myData[index]; }

    constexpr reference       front()       noexcept { return *myData; }
    constexpr const_reference front() const noexcept { return *myData; }

    constexpr reference       back()       noexcept { return myData[myLength - 1]; }
    constexpr const_reference back() const noexcept { return myData[myLength - 1]; }

    constexpr void popFront() noexcept { ++myData; --myLength; }
    constexpr void popBack () noexcept { --myLength; }

public:
    Slice operator () (size_type start, size_type end) const noexcept
    {
        return Slice(myData + start, end - start);
    }

    constexpr explicit operator bool () const noexcept
    {
        return !empty();
    }

private:
    pointer myData = nullptr;
    size_type myLength = 0;
};

template <typename T> Slice(T*, uz) -> Slice<T>;
template <typename T> Slice(T*, T*) -> Slice<T>;

template <typename T>
typename Slice<T>::iterator begin(Slice<T>& rhs)
{
    return rhs.begin();
}

template <typename T>
typename Slice<T>::const_iterator begin(Slice<T> const& rhs)
{
    return rhs.begin();
}

template <typename T>
typename Slice<T>::iterator end(Slice<T>& rhs)
{
    return rhs.end();
}

template <typename T>
typename Slice<T>::const_iterator end(Slice<T> const& rhs)
{
    return rhs.end();
}

} // namespace seqmatch
