// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include "format_number.h"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

#include "text.h"

namespace numfmt {

struct ErrorText {
    ValidationErrorKind kind;
    const char* key;
    const char* default_text;
};

// English fallbacks, used when the catalog has no translation.
static const ErrorText k_error_text[] = {
    {INVALID_PRECISION, "err_format_number_invalid_precision", "Invalid precision: Must be >= 1."},
    {INVALID_SCALE, "err_format_number_invalid_scale", "Invalid scale: Must be between 0 and precision."},
    {SIGN_WITHOUT_DIGITS, "err_format_number_sign_without_digits", "Invalid number: Sign without digits."},
    {UNSUPPORTED_CHARS, "err_format_number_unsupported_chars", "Invalid number: Unsupported characters."},
    {MULTIPLE_DECIMAL_SEPARATORS, "err_format_number_multiple_decimal_separators", "Invalid number: Multiple decimal separators."},
    {DOT_DECIMAL_NOT_SUPPORTED, "err_format_number_dot_decimal_not_supported", "Invalid number: Dot-decimal UI input is not supported. Use comma as decimal separator."},
    {DECIMALS_NOT_ALLOWED_FOR_SCALE_ZERO, "err_format_number_decimals_not_allowed_scale0", "Invalid number: Decimals are not allowed for scale=0."},
    {MISSING_INTEGER_PART, "err_format_number_missing_integer_part", "Invalid number: Missing integer part."},
    {MISSING_INTEGER_DIGITS, "err_format_number_missing_integer_digits", "Invalid number: Missing integer digits."},
    {MIXED_THOUSANDS_SEPARATORS, "err_format_number_mixed_thousands_seps", "Invalid number: Mixed thousands separators are not supported."},
    {DOT_GROUPING_MALFORMED, "err_format_number_dot_grouping_malformed", "Invalid number: Thousands grouping with \".\" is malformed."},
    {SPACE_GROUPING_MALFORMED, "err_format_number_space_grouping_malformed", "Invalid number: Thousands grouping with space is malformed."},
    {INTEGER_MUST_BE_DIGITS, "err_format_number_integer_must_be_digits", "Invalid number: Integer part must be digits."},
    {FRACTION_MUST_BE_DIGITS, "err_format_number_fraction_must_be_digits", "Invalid number: Fractional part must be digits only."},
    {TOO_MANY_FRACTION_DIGITS, "err_format_number_too_many_fraction_digits", "Invalid number: Too many fractional digits for scale=%SCALE%."},
    {TOO_MANY_INTEGER_DIGITS, "err_format_number_too_many_integer_digits", "Invalid number: Too many integer digits for DECIMAL(%PRECISION%,%SCALE%)."},
    {INVALID_SCALE_FROM_DB, "err_format_number_invalid_scale_fromdb", "Invalid scale: Must be >= 0."},
    {DB_SIGN_WITHOUT_DIGITS, "err_format_number_db_sign_without_digits", "Invalid DB number: Sign without digits."},
    {DB_INVALID_FORMAT, "err_format_number_db_invalid_format", "Invalid DB number: Expected dot-decimal without thousands separators."},
    {DB_TOO_MANY_FRACTION_DIGITS, "err_format_number_db_too_many_fraction_digits", "Invalid DB number: Too many fractional digits for requested scale=%SCALE%."},
    {INVALID_THOUSANDS_SEP, "err_format_number_invalid_thousands_sep", "Invalid thousands separator: Must be \"\", \".\", or \" \"."},
    {INVALID_DECIMAL_SEP, "err_format_number_invalid_decimal_sep", "Invalid decimal separator: Must be \",\" or \".\"."},
    {SEPARATORS_MUST_DIFFER, "err_format_number_invalid_separators_same", "Invalid separators: Thousands and decimal separators must differ."},
};

static const ErrorText& get_error_text(ValidationErrorKind kind)
{
    for (const ErrorText& entry : k_error_text) {
        if (entry.kind == kind) {
            return entry;
        }
    }
    // Every enumerator has an entry above.
    throw std::logic_error(absl::StrCat("Unknown validation error kind ", static_cast<int>(kind)));
}

std::string to_string(ValidationErrorKind kind)
{
    return get_error_text(kind).key;
}

static bool is_all_digits(absl::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return absl::ascii_isdigit(c); });
}

// Matches ^\d+\.\d+$, i.e. something which reads as a number with a decimal
// point and no grouping at all.
static bool is_dot_decimal(absl::string_view str)
{
    auto dot = str.find('.');
    if (dot == absl::string_view::npos || dot == 0 || dot + 1 == str.size()) {
        return false;
    }
    return is_all_digits(str.substr(0, dot)) && is_all_digits(str.substr(dot + 1));
}

// Matches ^\d+(\.\d+)?$, the only shape accepted from the database.
static bool is_db_decimal(absl::string_view str)
{
    if (str.empty()) {
        return false;
    }
    auto dot = str.find('.');
    if (dot == absl::string_view::npos) {
        return is_all_digits(str);
    }
    return is_dot_decimal(str);
}

// Matches ^\d{1,3}(<sep>\d{3})*$
static bool is_well_grouped(absl::string_view str, char sep)
{
    std::vector<absl::string_view> groups = absl::StrSplit(str, sep);
    for (size_t i = 0; i < groups.size(); ++i) {
        const absl::string_view group = groups[i];
        if (!is_all_digits(group)) {
            return false;
        }
        if (i == 0 ? (group.empty() || group.size() > 3) : (group.size() != 3)) {
            return false;
        }
    }
    return true;
}

static absl::string_view strip_leading_zeros(absl::string_view digits)
{
    while (digits.size() > 1 && digits.front() == '0') {
        digits.remove_prefix(1);
    }
    return digits;
}

std::string add_thousands(absl::string_view digits, absl::string_view sep)
{
    if (sep.empty() || digits.size() <= 3) {
        return std::string(digits);
    }
    std::string res;
    res.reserve(digits.size() + sep.size() * (digits.size() / 3));
    size_t head = digits.size() % 3;
    if (head == 0) {
        head = 3;
    }
    res.append(digits.data(), head);
    for (size_t pos = head; pos < digits.size(); pos += 3) {
        res.append(sep.data(), sep.size());
        res.append(digits.data() + pos, 3);
    }
    return res;
}

ValidationError NumberFormatter::Error(ValidationErrorKind kind, const TextVars& vars) const
{
    const ErrorText& text = get_error_text(kind);
    return ValidationError(kind, m_text(text.key, k_text_file, k_text_layer, text.default_text, vars));
}

void NumberFormatter::AssertPrecisionScale(int precision, int scale) const
{
    if (precision < 1) {
        throw Error(INVALID_PRECISION);
    }
    if (scale < 0 || scale > precision) {
        throw Error(INVALID_SCALE);
    }
}

void NumberFormatter::AssertUiSeparators(absl::string_view thousands_sep, absl::string_view decimal_sep) const
{
    if (!thousands_sep.empty() && thousands_sep != k_ui_thousands_dot && thousands_sep != k_ui_thousands_space) {
        throw Error(INVALID_THOUSANDS_SEP);
    }
    if (decimal_sep != k_ui_decimal_comma && decimal_sep != k_db_decimal_dot) {
        throw Error(INVALID_DECIMAL_SEP);
    }
    if (!thousands_sep.empty() && thousands_sep == decimal_sep) {
        throw Error(SEPARATORS_MUST_DIFFER);
    }
}

// The integer part may use either '.' or ' ' for grouping, but not both, and
// if it uses one then every group after the first must have three digits.
void NumberFormatter::AssertThousandsGrouping(absl::string_view int_part) const
{
    if (int_part.empty()) {
        throw Error(MISSING_INTEGER_PART);
    }

    const bool has_dot = int_part.find('.') != absl::string_view::npos;
    const bool has_space = int_part.find(' ') != absl::string_view::npos;

    if (has_dot && has_space) {
        throw Error(MIXED_THOUSANDS_SEPARATORS);
    }
    if (has_dot) {
        if (!is_well_grouped(int_part, '.')) {
            throw Error(DOT_GROUPING_MALFORMED);
        }
        return;
    }
    if (has_space) {
        if (!is_well_grouped(int_part, ' ')) {
            throw Error(SPACE_GROUPING_MALFORMED);
        }
        return;
    }
    if (!is_all_digits(int_part)) {
        throw Error(INTEGER_MUST_BE_DIGITS);
    }
}

std::optional<std::string> NumberFormatter::ToDb(const std::optional<std::string>& input, int precision, int scale) const
{
    using std::to_string;
    if (!input) {
        return std::nullopt;
    }
    absl::string_view raw = absl::StripAsciiWhitespace(*input);
    if (raw.empty()) {
        return std::nullopt;
    }

    AssertPrecisionScale(precision, scale);

    // An explicit '+' is accepted but not carried over into the output.
    bool negative = false;
    if (raw.front() == '-' || raw.front() == '+') {
        negative = (raw.front() == '-');
        raw.remove_prefix(1);
        raw = absl::StripAsciiWhitespace(raw);
        if (raw.empty()) {
            throw Error(SIGN_WITHOUT_DIGITS);
        }
    }

    // Only ASCII space is recognized as a grouping character.  In particular
    // a non-breaking space (or any other unicode space) is rejected here.
    for (char c : raw) {
        if (!absl::ascii_isdigit(c) && c != ',' && c != '.' && c != ' ') {
            throw Error(UNSUPPORTED_CHARS);
        }
    }

    const size_t comma_count = std::count(raw.begin(), raw.end(), ',');
    if (comma_count > 1) {
        throw Error(MULTIPLE_DECIMAL_SEPARATORS);
    }
    const bool has_comma = (comma_count == 1);

    // Without a comma, "1234.56" could be a decimal or a badly grouped
    // integer.  We refuse to guess.
    if (!has_comma && is_dot_decimal(raw)) {
        throw Error(DOT_DECIMAL_NOT_SUPPORTED);
    }

    absl::string_view int_part = raw;
    absl::string_view frac_part;
    if (has_comma) {
        const size_t comma = raw.find(',');
        int_part = raw.substr(0, comma);
        frac_part = raw.substr(comma + 1);
    }

    if (scale == 0 && has_comma) {
        throw Error(DECIMALS_NOT_ALLOWED_FOR_SCALE_ZERO);
    }

    // ",50" is read as "0,50", but only because the comma marks it as a
    // decimal.
    if (int_part.empty() && has_comma) {
        int_part = "0";
    }

    AssertThousandsGrouping(int_part);

    std::string int_digits;
    int_digits.reserve(int_part.size());
    for (char c : int_part) {
        if (c != '.' && c != ' ') {
            int_digits.push_back(c);
        }
    }
    if (int_digits.empty()) {
        throw Error(MISSING_INTEGER_DIGITS);
    }
    int_digits = std::string(strip_leading_zeros(int_digits));

    if (!frac_part.empty() && !is_all_digits(frac_part)) {
        throw Error(FRACTION_MUST_BE_DIGITS);
    }
    if (frac_part.size() > static_cast<size_t>(scale)) {
        throw Error(TOO_MANY_FRACTION_DIGITS, {{"scale", to_string(scale)}});
    }
    if (int_digits.size() > static_cast<size_t>(precision - scale)) {
        throw Error(TOO_MANY_INTEGER_DIGITS, {{"precision", to_string(precision)}, {"scale", to_string(scale)}});
    }

    std::string res = negative ? "-" : "";
    res += int_digits;
    if (scale > 0) {
        res += k_db_decimal_dot;
        res.append(frac_part.data(), frac_part.size());
        res.append(scale - frac_part.size(), '0');
    }
    return res;
}

std::string NumberFormatter::FromDb(const std::optional<std::string>& input, int scale, absl::string_view thousands_sep, absl::string_view decimal_sep) const
{
    using std::to_string;
    if (!input) {
        return "";
    }
    absl::string_view db = absl::StripAsciiWhitespace(*input);
    if (db.empty()) {
        return "";
    }

    if (scale < 0) {
        throw Error(INVALID_SCALE_FROM_DB);
    }

    AssertUiSeparators(thousands_sep, decimal_sep);

    bool negative = false;
    if (db.front() == '-' || db.front() == '+') {
        negative = (db.front() == '-');
        db.remove_prefix(1);
        if (db.empty()) {
            throw Error(DB_SIGN_WITHOUT_DIGITS);
        }
    }

    if (!is_db_decimal(db)) {
        throw Error(DB_INVALID_FORMAT);
    }

    absl::string_view int_part = db;
    absl::string_view frac_part;
    const size_t dot = db.find('.');
    if (dot != absl::string_view::npos) {
        int_part = db.substr(0, dot);
        frac_part = db.substr(dot + 1);
    }
    int_part = strip_leading_zeros(int_part);

    if (frac_part.size() > static_cast<size_t>(scale)) {
        throw Error(DB_TOO_MANY_FRACTION_DIGITS, {{"scale", to_string(scale)}});
    }

    std::string res = negative ? "-" : "";
    res += add_thousands(int_part, thousands_sep);
    if (scale == 0) {
        return res;
    }
    res.append(decimal_sep.data(), decimal_sep.size());
    res.append(frac_part.data(), frac_part.size());
    res.append(scale - frac_part.size(), '0');
    return res;
}

} // namespace numfmt

// End of File
