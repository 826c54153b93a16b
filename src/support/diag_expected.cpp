//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used by the verifier.
// Every failure leaving the library is an Expected<void> carrying one Diag, so
// severity wording and location formatting live here in one place.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace avrokit::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must check hasValue() first; calling this on a successful
///          result is undefined behaviour.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When @p sm is given and the location names a registered document,
///          the message is prefixed with "<path>:<line>:<column>: " following
///          the usual compiler style. Line and column are omitted when unknown.
///          A trailing newline is always written.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the text.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                    os << ':' << diag.loc.column;
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace avrokit::support
