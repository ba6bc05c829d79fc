#pragma once

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace seqmatch {

template <typename T>
struct nondeduced { using type = T; };

template <typename T>
using nondeduced_t = typename nondeduced<T>::type;

template <typename L, typename R>
std::enable_if_t<!std::is_scalar_v<L>>
swap(L& lhs, R& rhs) noexcept
{
    lhs.swap(rhs);
}

template <typename L, typename R>
std::enable_if_t<std::is_scalar_v<L>
              || (std::is_pointer_v<L> && std::is_pointer_v<R>)>
swap(L& lhs, R& rhs) noexcept
{
    using std::swap;
    swap(lhs, rhs);
}

class RuntimeException : public std::exception
{
public:
    RuntimeException(const char* file, unsigned line, std::string msg)
        : myFile(file)
        , myMsg(std::move(msg))
        , myLine(line)
    {
    }

    // std::exception
public:
    const char* what() const noexcept override { return myMsg.c_str(); }

public:
    const char* message() const noexcept { return myMsg.c_str(); }
    const char* file() const noexcept { return myFile; }
    unsigned line() const noexcept { return myLine; }

private:
    const char* myFile;
    std::string myMsg;
    unsigned myLine;
};

#define ENFORCE(V, M) ::seqmatch::enforce(!!(V), M, __FILE__, __LINE__)
#define ENFORCEU(M) throw ::seqmatch::RuntimeException(__FILE__, __LINE__, M)

inline void enforce(bool value, std::string msg, const char* file, unsigned line)
{
    if ( !value )
        throw RuntimeException(file, line, std::move(msg));
}

} // namespace seqmatch
