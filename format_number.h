// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUMFMT_FORMAT_NUMBER_H
#define NUMFMT_FORMAT_NUMBER_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"

#include "text.h"

namespace numfmt {

// Every way in which a conversion can be rejected.  The first group comes
// from parsing user input (NumberFormatter::ToDb), the second from parsing
// database values and output settings (NumberFormatter::FromDb).
enum ValidationErrorKind : int {
    INVALID_PRECISION,
    INVALID_SCALE,
    SIGN_WITHOUT_DIGITS,
    UNSUPPORTED_CHARS,
    MULTIPLE_DECIMAL_SEPARATORS,
    DOT_DECIMAL_NOT_SUPPORTED,
    DECIMALS_NOT_ALLOWED_FOR_SCALE_ZERO,
    MISSING_INTEGER_PART,
    MISSING_INTEGER_DIGITS,
    MIXED_THOUSANDS_SEPARATORS,
    DOT_GROUPING_MALFORMED,
    SPACE_GROUPING_MALFORMED,
    INTEGER_MUST_BE_DIGITS,
    FRACTION_MUST_BE_DIGITS,
    TOO_MANY_FRACTION_DIGITS,
    TOO_MANY_INTEGER_DIGITS,

    INVALID_SCALE_FROM_DB,
    DB_SIGN_WITHOUT_DIGITS,
    DB_INVALID_FORMAT,
    DB_TOO_MANY_FRACTION_DIGITS,
    INVALID_THOUSANDS_SEP,
    INVALID_DECIMAL_SEP,
    SEPARATORS_MUST_DIFFER,
};

// Returns the stable message key for the error, e.g.
// "err_format_number_too_many_fraction_digits".
std::string to_string(ValidationErrorKind kind);

class ValidationError : public std::invalid_argument {
protected:
    ValidationErrorKind m_kind;

public:
    ValidationError(ValidationErrorKind kind, const std::string& message)
        : std::invalid_argument(message)
        , m_kind(kind)
    {}

    inline ValidationErrorKind kind() const {
        return m_kind;
    }

    inline std::string key() const {
        return to_string(m_kind);
    }
};

// Strict conversion between numbers as typed by users ("1.234,56",
// "1 234,56") and fixed-point strings for DECIMAL(precision, scale) columns
// ("1234.56").  Values are never converted to binary floating point, never
// rounded, and never guessed at: anything ambiguous is rejected with a
// ValidationError whose message is resolved through the text lookup.
//
// The formatter holds no mutable state and is safe to share between threads
// provided the text lookup is.
class NumberFormatter {
protected:
    TextLookup m_text;

    ValidationError Error(ValidationErrorKind kind, const TextVars& vars = TextVars()) const;

    void AssertPrecisionScale(int precision, int scale) const;
    void AssertUiSeparators(absl::string_view thousands_sep, absl::string_view decimal_sep) const;
    void AssertThousandsGrouping(absl::string_view int_part) const;

public:
    static constexpr const char* k_ui_thousands_dot = ".";
    static constexpr const char* k_ui_thousands_space = " ";
    static constexpr const char* k_ui_decimal_comma = ",";
    static constexpr const char* k_db_decimal_dot = ".";

    // Catalog file and layer holding the error messages.
    static constexpr const char* k_text_file = "format_number";
    static constexpr const char* k_text_layer = "app";

    NumberFormatter() : m_text(passthrough_text) {}
    explicit NumberFormatter(TextLookup text) : m_text(std::move(text)) {}

    // Converts user input to a database string with exactly `scale`
    // fractional digits.  Returns std::nullopt if the input is absent or
    // blank.  Accepts "1234,56", "1.234,56", "1 234,56", "1.234.567" and
    // ",5"; rejects "1234.56" and anything with more than `scale`
    // fractional or `precision - scale` integer digits.
    std::optional<std::string> ToDb(const std::optional<std::string>& raw, int precision, int scale) const;

    // Renders a database string for display, padded to exactly `scale`
    // fractional digits and grouped with `thousands_sep` ("", "." or " ").
    // Returns the empty string if the input is absent or blank.
    std::string FromDb(const std::optional<std::string>& db, int scale = 2, absl::string_view thousands_sep = k_ui_thousands_dot, absl::string_view decimal_sep = k_ui_decimal_comma) const;
};

// Inserts `sep` between every group of three digits, counting from the
// right.  `digits` must consist of digits only.
std::string add_thousands(absl::string_view digits, absl::string_view sep);

} // namespace numfmt

#endif // NUMFMT_FORMAT_NUMBER_H

// End of File
