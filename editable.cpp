#include "editable.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <set>
#include <sstream>

namespace editable
{
//=============================================================================
// Value implementations
//=============================================================================

bool Value::isNumber() const noexcept
{
    return number().has_value();
}

std::type_info const& Value::type() const
{
    return std::visit([] (auto const& v) -> std::type_info const& { return typeid(v); }, underlying);
}

std::string_view Value::typeName() const noexcept
{
    return std::visit(cxxutils::multilambda(
        [] (Absent)             -> std::string_view { return "NoneType"; },
        [] (bool)               -> std::string_view { return "bool"; },
        [] (std::int64_t)       -> std::string_view { return "int"; },
        [] (double)             -> std::string_view { return "float"; },
        [] (std::string const&) -> std::string_view { return "str"; }
    ), underlying);
}

std::optional<double> Value::number() const noexcept
{
    return std::visit([] <typename T> (T const& v) -> std::optional<double>
    {
        if constexpr (detail::kIsNumeric<T>)
            return static_cast<double>(v);

        return {};
    }, underlying);
}

namespace
{
std::string doubleRepr(double d)
{
    if (std::isnan(d))
        return "nan";

    if (std::isinf(d))
        return d > 0 ? "inf" : "-inf";

    // shortest round-trip digits, e.g. "-1.2345678901234568e+17" or "1e-04"
    std::array<char, 64> buffer;
    auto const result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), d, std::chars_format::scientific);
    if (result.ec != std::errc())
        return std::format("{}", d);

    std::string_view const scientific(buffer.data(), static_cast<std::size_t>(result.ptr - buffer.data()));

    auto const ePos = scientific.find('e');
    auto mantissa = scientific.substr(0, ePos);
    auto exponentText = scientific.substr(ePos + 1);

    if (exponentText.front() == '+')
        exponentText.remove_prefix(1);

    int exponent = 0;
    if (std::from_chars(exponentText.data(), exponentText.data() + exponentText.size(), exponent).ec != std::errc())
        return std::format("{}", d);

    std::string text;
    if (mantissa.front() == '-')
    {
        text += '-';
        mantissa.remove_prefix(1);
    }

    std::string digits;
    std::copy_if(mantissa.begin(), mantissa.end(), std::back_inserter(digits), [] (char c) { return c != '.'; });

    if (exponent < -4 || exponent >= 16)
    {
        text += digits.front();

        if (digits.size() > 1)
            text += std::format(".{}", std::string_view(digits).substr(1));

        text += std::format("e{}{:02}", exponent < 0 ? '-' : '+', std::abs(exponent));
        return text;
    }

    if (exponent < 0)
        return text + "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;

    auto const integerDigits = static_cast<std::size_t>(exponent) + 1;

    if (digits.size() <= integerDigits)
        return text + digits + std::string(integerDigits - digits.size(), '0') + ".0";

    return text + digits.substr(0, integerDigits) + "." + digits.substr(integerDigits);
}

std::string stringRepr(std::string const& s)
{
    auto const hasSingle = s.find('\'') != std::string::npos;
    auto const hasDouble = s.find('"') != std::string::npos;
    auto const quote = (hasSingle && ! hasDouble) ? '"' : '\'';

    std::string text(1, quote);

    for (auto const c : s)
    {
        auto const uc = static_cast<unsigned char>(c);

        if (c == quote || c == '\\') { text += '\\'; text += c; }
        else if (c == '\n')          text += "\\n";
        else if (c == '\r')          text += "\\r";
        else if (c == '\t')          text += "\\t";
        else if (uc < 0x20 || uc == 0x7f)
            text += std::format("\\x{:02x}", uc);
        else
            text += c;
    }

    text += quote;
    return text;
}
}

namespace
{
std::partial_ordering compareIntegerWithDouble(std::int64_t i, double d)
{
    // 2^63 is exactly representable, every double at or beyond it exceeds any int64
    constexpr auto kLimit = 9223372036854775808.0;

    if (std::isnan(d))
        return std::partial_ordering::unordered;

    if (d >= kLimit)
        return std::partial_ordering::less;

    if (d < -kLimit)
        return std::partial_ordering::greater;

    auto const whole = std::trunc(d);
    auto const truncated = static_cast<std::int64_t>(whole);

    if (i != truncated)
        return i <=> truncated;

    return 0.0 <=> (d - whole);
}

template <typename A, typename B>
std::partial_ordering compareNumbers(A a, B b)
{
    if constexpr (detail::kIsIntegral<A> && detail::kIsIntegral<B>)
        return static_cast<std::int64_t>(a) <=> static_cast<std::int64_t>(b);
    else if constexpr (std::is_same_v<A, double> && std::is_same_v<B, double>)
        return a <=> b;
    else if constexpr (std::is_same_v<B, double>)
        return compareIntegerWithDouble(static_cast<std::int64_t>(a), b);
    else
        return 0 <=> compareIntegerWithDouble(static_cast<std::int64_t>(b), a);
}
}

std::string Value::repr() const
{
    return std::visit(cxxutils::multilambda(
        [] (Absent)                -> std::string { return "None"; },
        [] (bool b)                -> std::string { return b ? "True" : "False"; },
        [] (std::int64_t i)        -> std::string { return std::format("{}", i); },
        [] (double d)              -> std::string { return doubleRepr(d); },
        [] (std::string const& s)  -> std::string { return stringRepr(s); }
    ), underlying);
}

std::string Value::str() const
{
    if (auto const* s = std::get_if<std::string>(&underlying))
        return *s;

    return repr();
}

bool operator==(Value const& lhs, Value const& rhs)
{
    return std::visit([] <typename A, typename B> (A const& a, B const& b) -> bool
    {
        if constexpr (detail::kIsNumeric<A> && detail::kIsNumeric<B>)
            return compareNumbers(a, b) == 0;
        else if constexpr (std::is_same_v<A, B>)
            return a == b;
        else
            return false;
    }, lhs.underlying, rhs.underlying);
}

namespace
{
std::int64_t checkedInteger(bool overflowed, std::int64_t result, char symbol)
{
    if (overflowed)
        throw makeError<OverflowError>("integer result of {} does not fit into 64 bits", symbol);

    return result;
}
}

Value operator+(Value const& lhs, Value const& rhs)
{
    return std::visit(cxxutils::multilambda(
        [] (std::string const& a, std::string const& b) -> Value
        {
            return a + b;
        },
        [&lhs, &rhs] <typename A, typename B> (A const& a, B const& b) -> Value
        {
            if constexpr (detail::kIsIntegral<A> && detail::kIsIntegral<B>)
            {
                std::int64_t result = 0;
                auto const overflowed = __builtin_add_overflow(static_cast<std::int64_t>(a), static_cast<std::int64_t>(b), &result);
                return checkedInteger(overflowed, result, '+');
            }
            else if constexpr (detail::kIsNumeric<A> && detail::kIsNumeric<B>)
                return static_cast<double>(a) + static_cast<double>(b);
            else
                throw makeError<TypeError>("unsupported operand type(s) for +: '{}' and '{}'", lhs.typeName(), rhs.typeName());
        }
    ), lhs.underlying, rhs.underlying);
}

Value operator-(Value const& lhs, Value const& rhs)
{
    return std::visit([&lhs, &rhs] <typename A, typename B> (A const& a, B const& b) -> Value
    {
        if constexpr (detail::kIsIntegral<A> && detail::kIsIntegral<B>)
        {
            std::int64_t result = 0;
            auto const overflowed = __builtin_sub_overflow(static_cast<std::int64_t>(a), static_cast<std::int64_t>(b), &result);
            return checkedInteger(overflowed, result, '-');
        }
        else if constexpr (detail::kIsNumeric<A> && detail::kIsNumeric<B>)
            return static_cast<double>(a) - static_cast<double>(b);
        else
            throw makeError<TypeError>("unsupported operand type(s) for -: '{}' and '{}'", lhs.typeName(), rhs.typeName());
    }, lhs.underlying, rhs.underlying);
}

std::partial_ordering operator<=>(Value const& lhs, Value const& rhs)
{
    return std::visit(cxxutils::multilambda(
        [] (std::string const& a, std::string const& b) -> std::partial_ordering
        {
            return a <=> b;
        },
        [&lhs, &rhs] <typename A, typename B> (A const& a, B const& b) -> std::partial_ordering
        {
            if constexpr (detail::kIsNumeric<A> && detail::kIsNumeric<B>)
                return compareNumbers(a, b);
            else
                throw makeError<TypeError>("ordering not supported between instances of '{}' and '{}'", lhs.typeName(), rhs.typeName());
        }
    ), lhs.underlying, rhs.underlying);
}

//=============================================================================
// Error implementations
//=============================================================================

UnknownFieldError::UnknownFieldError(std::string_view typeName, std::string_view fieldname)
    : Error(std::format("'{}' object has no field '{}'", typeName, fieldname)), field(fieldname)
{}

IndexError::IndexError(std::ptrdiff_t index, std::size_t size)
    : Error(std::format("index {} out of range for {} fields", index, size)), idx(index), length(size)
{}

IndexError::IndexError(std::string const& message) : Error(message) {}

ValidationError::ValidationError(std::string_view fieldname, Value offending_)
    : Error(std::format("invalid value {} for field '{}'", offending_.repr(), fieldname)), field(fieldname), offending(std::move(offending_))
{}

ValidationError::ValidationError(std::string_view fieldname, Value offending_, std::string const& message)
    : Error(message), field(fieldname), offending(std::move(offending_))
{}

//=============================================================================
// Slice implementations
//=============================================================================

std::vector<std::size_t> Slice::indices(std::size_t length) const
{
    if (step == 0)
        throw IndexError("slice step cannot be zero");

    auto const n = static_cast<std::ptrdiff_t>(length);
    auto const lower = step < 0 ? std::ptrdiff_t(-1) : std::ptrdiff_t(0);
    auto const upper = step < 0 ? n - 1 : n;

    auto const clampBound = [n, lower, upper] (std::ptrdiff_t bound)
    {
        if (bound < 0)
            bound += n;

        return std::clamp(bound, lower, upper);
    };

    auto const first = start.has_value() ? clampBound(*start) : (step < 0 ? upper : lower);
    auto const last  = stop.has_value()  ? clampBound(*stop)  : (step < 0 ? lower : upper);

    std::vector<std::size_t> result;

    for (auto i = first; step > 0 ? i < last : i > last; i += step)
    {
        result.push_back(static_cast<std::size_t>(i));

        // stop before stepping past last, i + step may not be representable
        if (step > 0 ? last - i <= step : last - i >= step)
            break;
    }

    return result;
}

//=============================================================================
// Schema implementations
//=============================================================================

namespace
{
bool isIdentifier(std::string_view name)
{
    if (name.empty())
        return false;

    auto const isHead = [] (char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; };
    auto const isTail = [isHead] (char c) { return isHead(c) || std::isdigit(static_cast<unsigned char>(c)) != 0; };

    return isHead(name.front()) && std::all_of(name.begin() + 1, name.end(), isTail);
}

std::vector<std::string> splitFieldnames(std::string const& fieldnames)
{
    std::vector<std::string> elements;
    std::istringstream ss(fieldnames);
    for (std::string fieldname; ss >> fieldname;)
        elements.emplace_back(std::move(fieldname));

    return elements;
}
}

Schema::Schema(private_constructor_t, std::string name, std::vector<FieldDescriptor> fieldDescriptors_, Validator validator_, Flavor flavor)
    : typeName(std::move(name)), fieldDescriptors(std::move(fieldDescriptors_)), validator(std::move(validator_)), kind(flavor)
{
    for (std::size_t i = 0; i < fieldDescriptors.size(); ++i)
        lookup.emplace(fieldDescriptors[i].fieldname, i);
}

Schema::Ptr Schema::define(std::string name, std::vector<std::string> fieldnames, Options options)
{
    if (name.empty())
        throw ConfigurationError("a record type needs a name");

    if (fieldnames.size() == 1)
        fieldnames = splitFieldnames(fieldnames.front());

    if (fieldnames.empty())
        throw makeError<ConfigurationError>("'{}' needs at least one field", name);

    if (options.defaults.size() > fieldnames.size())
        throw makeError<ConfigurationError>("'{}' has {} fields but {} defaults", name, fieldnames.size(), options.defaults.size());

    std::set<std::string_view> seen;
    std::vector<FieldDescriptor> descriptors;
    descriptors.reserve(fieldnames.size());

    for (std::size_t i = 0; i < fieldnames.size(); ++i)
    {
        auto const& fieldname = fieldnames[i];

        if (! isIdentifier(fieldname))
            throw makeError<ConfigurationError>("'{}' is not a valid field name for '{}'", fieldname, name);

        if (! seen.insert(fieldname).second)
            throw makeError<ConfigurationError>("'{}' has a duplicate field '{}'", name, fieldname);

        auto defaultValue = i < options.defaults.size() ? std::move(options.defaults[i]) : Value(kAbsent);
        descriptors.push_back({.fieldname = fieldname, .defaultValue = std::move(defaultValue)});
    }

    return std::make_shared<Schema>(private_constructor_t(), std::move(name), std::move(descriptors),
                                    std::move(options.validator), options.flavor);
}

std::optional<std::size_t> Schema::indexOf(std::string_view fieldname) const
{
    auto it = lookup.find(fieldname);

    if (it == lookup.end())
        return {};

    return it->second;
}

bool Schema::isCompatible(Schema const& other) const noexcept
{
    if (this == &other)
        return true;

    return typeName == other.typeName
        && std::equal(fieldDescriptors.begin(), fieldDescriptors.end(), other.fieldDescriptors.begin(), other.fieldDescriptors.end(),
                      [] (FieldDescriptor const& a, FieldDescriptor const& b) { return a.fieldname == b.fieldname; });
}

Record Schema::construct(std::vector<Value> positional, Dict named) const
{
    auto const n = fieldDescriptors.size();
    auto const supplied = positional.size() + named.size();

    if (supplied > n)
        throw makeError<ArityError>("{} accepts up to {} args; got {}", typeName, n, supplied);

    // values are collected here and only handed to a Record once every write succeeded
    std::vector<Value> values;
    values.reserve(n);

    for (std::size_t i = 0; i < n; ++i)
    {
        if (i < positional.size())
            values.push_back(validate(i, std::move(positional[i])));
        else
            values.push_back(validate(i, fieldDescriptors[i].defaultValue));
    }

    for (auto& [fieldname, newValue] : named)
    {
        auto const idx = indexOf(fieldname);

        if (! idx.has_value())
            throw UnknownFieldError(typeName, fieldname);

        values[*idx] = validate(*idx, std::move(newValue));
    }

    return Record(shared_from_this(), std::move(values));
}

Value Schema::validate(std::size_t idx, Value candidate) const
{
    if (! validator)
        return candidate;

    return validator(fieldDescriptors[idx].fieldname, candidate);
}

//=============================================================================
// Record implementations
//=============================================================================

Record::Record(Schema::Ptr schema_, std::vector<Value> values_)
    : meta(std::move(schema_)), values(std::move(values_))
{}

Record& Record::operator=(Record const& o)
{
    if (this != &o)
    {
        requireCompatible(o);
        meta = o.meta;
        values = o.values;
    }

    return *this;
}

Record& Record::operator=(Record&& o)
{
    if (this != &o)
    {
        requireCompatible(o);
        meta = std::move(o.meta);
        values = std::move(o.values);
    }

    return *this;
}

void Record::requireCompatible(Record const& o) const
{
    // moved-from records have no schema
    if (meta == nullptr || o.meta == nullptr)
        return;

    if (! meta->isCompatible(*o.meta))
        throw makeError<TypeError>("cannot assign a '{}' record to a '{}' record", o.meta->name(), meta->name());
}

Record::FieldRef& Record::FieldRef::operator=(Value newValue)
{
    record.store(idx, std::move(newValue));
    return *this;
}

Value const& Record::FieldRef::get() const
{
    return record.values[idx];
}

std::string_view Record::FieldRef::fieldname() const
{
    return record.meta->fields()[idx].fieldname;
}

std::size_t Record::indexOf(std::string_view fieldname) const
{
    auto const idx = meta->indexOf(fieldname);

    if (! idx.has_value())
        throw UnknownFieldError(meta->name(), fieldname);

    return *idx;
}

Value const& Record::get(std::string_view fieldname) const
{
    return values[indexOf(fieldname)];
}

void Record::set(std::string_view fieldname, Value newValue)
{
    store(indexOf(fieldname), std::move(newValue));
}

Record::FieldRef Record::operator()(std::string_view fieldname)
{
    return FieldRef(*this, indexOf(fieldname));
}

void Record::removeField(std::string_view fieldname)
{
    throw makeError<OperationNotSupportedError>("'{}' object does not support field deletion (field '{}')", meta->name(), fieldname);
}

std::size_t Record::size() const
{
    requireIndexable("len()");
    return values.size();
}

Value const& Record::at(std::ptrdiff_t index) const
{
    return values[resolveIndex(index)];
}

void Record::setAt(std::ptrdiff_t index, Value newValue)
{
    store(resolveIndex(index), std::move(newValue));
}

Record::FieldRef Record::operator[](std::ptrdiff_t index)
{
    return FieldRef(*this, resolveIndex(index));
}

std::vector<Value> Record::slice(Slice const& range) const
{
    requireIndexable("slicing");

    std::vector<Value> result;
    for (auto const idx : range.indices(values.size()))
        result.push_back(values[idx]);

    return result;
}

void Record::assignSlice(Slice const& range, std::span<Value const> newValues)
{
    requireIndexable("slice assignment");

    auto const indices = range.indices(values.size());
    auto const count = std::min(indices.size(), newValues.size());

    for (std::size_t k = 0; k < count; ++k)
        store(indices[k], newValues[k]);
}

void Record::removeAt(std::ptrdiff_t index)
{
    throw makeError<OperationNotSupportedError>("'{}' object does not support item deletion (index {})", meta->name(), index);
}

void Record::removeSlice(Slice const&)
{
    throw makeError<OperationNotSupportedError>("'{}' object does not support item deletion", meta->name());
}

bool Record::contains(Value const& value) const
{
    requireIndexable("membership tests");
    return std::find(values.begin(), values.end(), value) != values.end();
}

Record::const_iterator Record::begin() const
{
    requireIndexable("iteration");
    return values.begin();
}

Record::const_iterator Record::end() const
{
    requireIndexable("iteration");
    return values.end();
}

std::vector<Value> Record::toTuple() const
{
    return values;
}

Dict Record::toDict() const
{
    Dict result;
    result.reserve(values.size());

    visitFields([&result] (std::string_view fieldname, Value const& value)
    {
        result.emplace_back(std::string(fieldname), value);
    });

    return result;
}

std::string Record::describe() const
{
    std::ostringstream ss;
    ss << meta->name() << "(";

    auto first = true;
    visitFields([&ss, &first] (std::string_view fieldname, Value const& value)
    {
        if (! std::exchange(first, false))
            ss << ", ";

        ss << fieldname << "=" << value.repr();
    });

    ss << ")";
    return ss.str();
}

std::size_t Record::resolveIndex(std::ptrdiff_t index) const
{
    requireIndexable("indexing");

    auto const n = static_cast<std::ptrdiff_t>(values.size());
    auto const resolved = index < 0 ? index + n : index;

    if (resolved < 0 || resolved >= n)
        throw IndexError(index, values.size());

    return static_cast<std::size_t>(resolved);
}

void Record::requireIndexable(std::string_view operation) const
{
    if (! meta->isIndexable())
        throw makeError<OperationNotSupportedError>("'{}' object does not support {}", meta->name(), operation);
}

void Record::store(std::size_t idx, Value newValue)
{
    // validate first so that a rejected value leaves the field untouched
    values[idx] = meta->validate(idx, std::move(newValue));
}

bool operator==(Record const& lhs, Record const& rhs)
{
    if (! lhs.meta->isCompatible(*rhs.meta))
        return false;

    return lhs.values == rhs.values;
}

std::partial_ordering operator<=>(Record const& lhs, Record const& rhs)
{
    if (! lhs.meta->isCompatible(*rhs.meta))
        return std::partial_ordering::unordered;

    auto const [a, b] = std::mismatch(lhs.values.begin(), lhs.values.end(), rhs.values.begin(), rhs.values.end());

    if (a == lhs.values.end())
        return b == rhs.values.end() ? std::partial_ordering::equivalent : std::partial_ordering::less;

    if (b == rhs.values.end())
        return std::partial_ordering::greater;

    return *a <=> *b;
}

//=============================================================================
// Stream operators
//=============================================================================

std::ostream& operator<<(std::ostream& o, Value const& x)
{
    return o << x.str();
}

std::ostream& operator<<(std::ostream& o, Record const& x)
{
    return o << x.describe();
}
} // namespace editable
