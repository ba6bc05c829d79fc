#pragma once

#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include <seqmatch/Types.hpp>

namespace seqmatch {

class OutStream
{
public:
    explicit OutStream(std::ostream& sink) noexcept;

    OutStream(OutStream const&) = delete;
    void operator = (OutStream const&) = delete;

    ~OutStream();

public:
    template <typename T>
    OutStream& operator () (T const& rhs);

    // Ends the current line
    OutStream& operator () ();

public:
    void write(char c);
    void write(std::string_view s);
    void flush();

private:
    std::ostream* mySink = nullptr;
};

class StringSink
{
public:
    void write(char c) { myBuffer.push_back(c); }
    void write(std::string_view s) { myBuffer.append(s.data(), s.size()); }

    std::string const& str() const& { return myBuffer; }
    std::string str() && { return std::move(myBuffer); }

private:
    std::string myBuffer;
};

namespace ascii {
    template <typename Sink>
    void write(Sink& sink, char c)
    {
        sink.write(c);
    }

    template <typename Sink>
    void write(Sink& sink, char const* s)
    {
        sink.write(std::string_view(s));
    }

    template <typename Sink>
    void write(Sink& sink, std::string_view s)
    {
        sink.write(s);
    }

    template <typename Sink>
    void write(Sink& sink, std::string const& s)
    {
        sink.write(std::string_view(s));
    }

    template <typename Sink>
    void write(Sink& sink, bool b)
    {
        sink.write(b ? std::string_view("true") : std::string_view("false"));
    }

    template <typename Sink, typename T>
    std::enable_if_t<std::is_integral_v<T>
                 && !std::is_same_v<T, bool>
                 && !std::is_same_v<T, char>>
    write(Sink& sink, T n)
    {
        sink.write(std::to_string(n));
    }
} // namespace ascii

template <typename T>
OutStream& OutStream::operator () (T const& rhs)
{
    ascii::write(*this, rhs);
    return *this;
}

/**
 * Item rendering
 *
 * A Show<T> turns an element into the text used by traces and by the
 * accumulators' rendering. defaultShow picks a reasonable rendering for
 * strings, numbers and stream-insertable types, and falls back to "?".
 */
template <typename T>
using Show = std::function<std::string(T const&)>;

template <typename T, typename = void>
struct is_ostreamable : std::false_type {};

template <typename T>
struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<T const&>())>>
    : std::true_type {};

template <typename T>
Show<T> defaultShow()
{
    return [](T const& v) -> std::string {
        if constexpr ( std::is_convertible_v<T const&, std::string_view> ) {
            return std::string(std::string_view(v));
        }
        else if constexpr ( std::is_arithmetic_v<T> ) {
            return std::to_string(v);
        }
        else if constexpr ( is_ostreamable<T>::value ) {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        }
        else {
            return "?";
        }
    };
}

template <typename T>
Show<T> orDefault(Show<T> show)
{
    if ( show )
        return show;

    return defaultShow<T>();
}

} // namespace seqmatch
