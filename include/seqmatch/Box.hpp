#pragma once

#include <cstddef>
#include <type_traits>

#include <seqmatch/Utilities.hpp>

namespace seqmatch {

struct Deleter
{
    template <typename T>
    void operator () (T* p) const
    {
        delete p;
    }
};

/**
 * Owning, move-only pointer
 *
 * A null box is the library's "nothing" for polymorphic results: the
 * traversal hands back an empty box when no walk exists.
 */
template <typename T, typename D = Deleter>
class Box : private D
{
public:
    template <typename TOther, typename DOther>
    friend class Box;

    using Element = T;

public:
    constexpr /*implicit*/ Box() noexcept = default;

    constexpr /*implicit*/ Box(std::nullptr_t) noexcept
        : Box()
    {
    }

    Box& operator = (std::nullptr_t) noexcept
    {
        reset();
        return *this;
    }

    explicit Box(T* p) noexcept
        : myPtr(p)
    {
    }

    Box(Box const&) = delete;
    void operator = (Box const&) = delete;

    Box(Box&& rhs) noexcept
        : myPtr(rhs.release())
    {
    }

    Box& operator = (Box&& rhs) noexcept
    {
        reset(rhs.release());
        return *this;
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    /*implicit*/ Box(Box<U, D>&& rhs) noexcept
        : myPtr(rhs.release())
    {
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    Box& operator = (Box<U, D>&& rhs) noexcept
    {
        reset(rhs.release());
        return *this;
    }

    ~Box() noexcept
    {
        reset();
    }

    void swap(Box& rhs) noexcept
    {
        using seqmatch::swap;
        swap(myPtr, rhs.myPtr);
    }

public:
    T* operator -> () noexcept
    {
        return myPtr;
    }

    T const* operator -> () const noexcept
    {
        return myPtr;
    }

    T& operator * () noexcept
    {
        return *myPtr;
    }

    T const& operator * () const noexcept
    {
        return *myPtr;
    }

    explicit operator bool () const noexcept
    {
        return myPtr != nullptr;
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    bool operator == (Box<U, D> const& rhs) const noexcept
    {
        return myPtr == rhs.myPtr;
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    bool operator != (Box<U, D> const& rhs) const noexcept
    {
        return !operator==(rhs);
    }

    T* get() noexcept
    {
        return myPtr;
    }

    T const* get() const noexcept
    {
        return myPtr;
    }

    T* release() noexcept
    {
        auto ret = myPtr;
        myPtr = nullptr;
        return ret;
    }

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    void reset(U* p) noexcept
    {
        auto old = myPtr;
        myPtr = p;
        if ( old )
            D::operator()(old);
    }

    void reset() noexcept
    {
        reset(static_cast<T*>(nullptr));
    }

private:
    T* myPtr = nullptr;
};

template <typename T, typename... Args>
Box<T> mk(Args&&... args)
{
    return Box<T>(new T(std::forward<Args>(args)...));
}

} // namespace seqmatch
