#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <seqmatch/Box.hpp>
#include <seqmatch/Slice.hpp>
#include <seqmatch/Stream.hpp>
#include <seqmatch/Types.hpp>

#include <seqmatch/notation/Token.hpp>

namespace seqmatch::notation {

#define DEFINE_DIAGNOSTIC_KINDS(X) \
    X(lexer_error, "is not part of the sequence notation") \
    \
    X(expected_item, "expected an item identifier") \
    X(expected_integer, "expected integer") \
    X(expected_close_brace, "expected '}' to close the quantifier") \
    X(expected_close_bracket, "expected ']' to close the sequence") \
    \
    X(inverted_bounds, "quantifier minimum exceeds its maximum") \
    X(bound_overflow, "quantifier bound is too large") \
    \
    X(unexpected_token, "grammar at this point is not recognized")

enum class diag
{
#define X(a,b) a,
    DEFINE_DIAGNOSTIC_KINDS(X)
#undef X
};

const char* to_string(diag d);

class Report
{
public:
    // Token the report is about; keeps its own copy of the lexeme
    struct Subject
    {
        TokenKind kind = TokenKind::Undefined;
        std::string lexeme;
        SourceLocation location;
    };

public:
    Report(diag code, Token const& token);

    Report(Report& rhs) = delete;
    void operator = (Report&) = delete;

public:
    diag code() const;
    Subject const& subject() const;
    Slice<std::string const> sentence() const;

public:
    void append(std::string word);

private:
    diag myCode;
    Subject mySubject;
    std::vector<std::string> mySentence;
};

class ReportProxy;

class Diagnostics
{
public:
    Diagnostics() noexcept;
    ~Diagnostics() noexcept;

public:
    ReportProxy error(diag code, Token const& token);

    uz errorCount() const;
    Report const& report(uz index) const;

    void dumpErrors(OutStream& stream) const;
    void clear();

private:
    std::vector<Box<Report>> myErrors;
};

class ReportProxy
{
public:
    /*implicit*/ ReportProxy(Diagnostics& d, Report& r)
        : myDiagnostics(&d)
        , myReport(&r)
    {
    }

public:
    ReportProxy& expected(std::string_view what);
    ReportProxy& see(Token const& token);

private:
    Diagnostics* myDiagnostics = nullptr;
    Report* myReport = nullptr;
};

std::string str(Report const& err);

} // namespace seqmatch::notation

namespace seqmatch::ascii {
    void write(OutStream& sink, notation::Report const& err);
    void write(StringSink& sink, notation::Report const& err);
}
