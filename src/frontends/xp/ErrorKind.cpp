//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Descriptor table backing ErrorKind. The table is indexed by the enumerator
// value and checked against the enum size at compile time.
//
//===----------------------------------------------------------------------===//

#include "frontends/xp/ErrorKind.hpp"

#include <array>
#include <cstddef>

namespace xpresso::frontends::xp
{
namespace
{
constexpr std::array<ErrorKindInfo, 18> kErrorKindTable{{
    {"IO_FAILURE", "X0001", ErrorPhase::Fatal, "Check that the file exists and is readable"},
    {"INVALID_CHARACTER", "X1001", ErrorPhase::Lexical, "Remove the character"},
    {"UNTERMINATED_STRING", "X1002", ErrorPhase::Lexical, "Add the closing quote"},
    {"UNTERMINATED_COMMENT", "X1003", ErrorPhase::Lexical, "Close the comment with '*/'"},
    {"INVALID_ESCAPE_SEQUENCE",
     "X1004",
     ErrorPhase::Lexical,
     "Use one of \\n, \\t, \\r, \\\" or \\\\"},
    {"INVALID_IDENTIFIER",
     "X1005",
     ErrorPhase::Lexical,
     "Identifiers start with a letter or '_' and contain letters, digits and '_'"},
    {"INVALID_NUMBER_FORMAT", "X1006", ErrorPhase::Lexical, "Add digits after the decimal point"},
    {"INVALID_DATE_FORMAT", "X1007", ErrorPhase::Lexical, "Use format [YYYY|MM|DD]"},
    {"INVALID_FRACTION_FORMAT",
     "X1008",
     ErrorPhase::Lexical,
     "Fractions should be in the format numerator|denominator"},
    {"INVALID_COMPLEX_LITERAL", "X1009", ErrorPhase::Lexical, "Use format $(real,imag)"},
    {"MISMATCHED_DELIMITERS", "X1010", ErrorPhase::Lexical, "Remove the closer or add its matching opener"},
    {"INVALID_OPERATOR", "X1011", ErrorPhase::Lexical, "Split the operator or remove the extra characters"},
    {"UNEXPECTED_TOKEN", "X2001", ErrorPhase::Syntax, "Remove or replace the token"},
    {"MISSING_TOKEN", "X2002", ErrorPhase::Syntax, "Insert the missing token"},
    {"UNEXPECTED_END_OF_INPUT", "X2003", ErrorPhase::Syntax, "Complete the construct before the end of the file"},
    {"INVALID_SYNTAX", "X2004", ErrorPhase::Syntax, "Check the construct against the language grammar"},
    {"NESTING_TOO_DEEP", "X2005", ErrorPhase::Syntax, "Split the construct into smaller pieces"},
    {"DUPLICATE_DECLARATION", "X3001", ErrorPhase::Scope, "Rename one of the declarations"},
}};

static_assert(kErrorKindTable.size() == static_cast<std::size_t>(ErrorKind::DuplicateDeclaration) + 1,
              "ErrorKind descriptor table out of sync with the enum");
} // namespace

const ErrorKindInfo &getInfo(ErrorKind kind)
{
    return kErrorKindTable[static_cast<std::size_t>(kind)];
}

std::string_view errorKindId(ErrorKind kind)
{
    return getInfo(kind).id;
}

std::string_view errorKindCode(ErrorKind kind)
{
    return getInfo(kind).code;
}

ErrorPhase errorPhase(ErrorKind kind)
{
    return getInfo(kind).phase;
}

std::string_view errorPhaseName(ErrorPhase phase)
{
    switch (phase)
    {
        case ErrorPhase::Fatal:
            return "fatal";
        case ErrorPhase::Lexical:
            return "lexical";
        case ErrorPhase::Syntax:
            return "syntax";
        case ErrorPhase::Scope:
            return "scope";
    }
    return "";
}

} // namespace xpresso::frontends::xp
