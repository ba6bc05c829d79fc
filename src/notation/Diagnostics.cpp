#include <seqmatch/notation/Diagnostics.hpp>

#include <seqmatch/Utilities.hpp>

namespace seqmatch::notation {

const char* to_string(diag d)
{
    static const char* DIAG_STRING[] = {
    #define X(a,b) b,
        DEFINE_DIAGNOSTIC_KINDS(X)
    #undef X
    };

    return DIAG_STRING[unsigned(d)];
}

//
// Report

Report::Report(diag code, Token const& token)
    : myCode(code)
    , mySubject{ token.kind(), std::string(token.lexeme()), token.location() }
{
}

diag Report::code() const
{
    return myCode;
}

Report::Subject const& Report::subject() const
{
    return mySubject;
}

Slice<std::string const> Report::sentence() const
{
    return mySentence;
}

void Report::append(std::string word)
{
    mySentence.emplace_back(std::move(word));
}

//
// Diagnostics

Diagnostics::Diagnostics() noexcept = default;

Diagnostics::~Diagnostics() noexcept = default;

ReportProxy Diagnostics::error(diag code, Token const& token)
{
    myErrors.emplace_back(mk<Report>(code, token));
    return { *this, *myErrors.back() };
}

uz Diagnostics::errorCount() const
{
    return myErrors.size();
}

Report const& Diagnostics::report(uz index) const
{
    ENFORCE(index < myErrors.size(), "report index out of range");
    return *myErrors[index];
}

void Diagnostics::dumpErrors(OutStream& stream) const
{
    for ( auto const& e : myErrors )
        ascii::write(stream, *e);

    stream.flush();
}

void Diagnostics::clear()
{
    myErrors.clear();
}

//
// ReportProxy

ReportProxy& ReportProxy::expected(std::string_view what)
{
    myReport->append("expected " + std::string(what));
    return *this;
}

ReportProxy& ReportProxy::see(Token const& token)
{
    StringSink sink;
    ascii::write(sink, "see '");
    ascii::write(sink, token.lexeme());
    ascii::write(sink, "' at ");
    ascii::write(sink, token.location());
    myReport->append(std::move(sink).str());
    return *this;
}

//
// misc

namespace {
    template <typename Sink>
    void reportSubject(Sink& sink, Report::Subject const& subj)
    {
        if ( subj.kind == TokenKind::EndOfInput ) {
            ascii::write(sink, "end of input");
            return;
        }

        ascii::write(sink, '\'');
        ascii::write(sink, subj.lexeme);
        ascii::write(sink, '\'');
    }

    template <typename Sink>
    void writeReport(Sink& sink, Report const& err)
    {
        auto const& subj = err.subject();
        ascii::write(sink, subj.location);
        ascii::write(sink, ": error: ");
        reportSubject(sink, subj);
        ascii::write(sink, ' ');
        ascii::write(sink, to_string(err.code()));
        ascii::write(sink, '\n');

        for ( auto const& word : err.sentence() ) {
            ascii::write(sink, subj.location);
            ascii::write(sink, ": ");
            ascii::write(sink, word);
            ascii::write(sink, '\n');
        }
    }
} // namespace

std::string str(Report const& err)
{
    StringSink sink;
    ascii::write(sink, err);
    return std::move(sink).str();
}

} // namespace seqmatch::notation

namespace seqmatch::ascii {

void write(OutStream& sink, notation::Report const& err)
{
    notation::writeReport(sink, err);
}

void write(StringSink& sink, notation::Report const& err)
{
    notation::writeReport(sink, err);
}

} // namespace seqmatch::ascii
