/**
 * @file editable.hpp
 * @brief Runtime factory for editable record types with validated field writes
 *
 * This file implements a small record type factory. Given a type name and an
 * ordered list of field names, Schema::define() produces an immutable Schema
 * from which Record instances are constructed. Records:
 *   - hold exactly one Value per schema field
 *   - may be read and written by field name (and by index for indexable schemas)
 *   - route every write through the schema's optional validator
 *   - compare by value (never hashable), and print as TypeName(field=value, ...)
 *
 * Usage example:
 *   auto Rgb = Schema::define("Rgb", "red green blue", {.defaults = {0, 0, 0}});
 *   auto navy = Rgb->construct({}, {{"blue", 128}});
 *   navy("red") = 10;                  // goes through the validator, if any
 *   std::cout << navy << std::endl;    // Rgb(red=10, green=0, blue=128)
 *
 * A record layout may also be declared as a C++ aggregate of Field<> members,
 * which enables compile-time checked field access:
 *   struct Point {
 *       Field<"x"> x;
 *       Field<"y"> y;
 *   };
 *   TypedRecord<Point> p(Schema::fromStruct<Point>("Point"), {3, 4});
 *   p("x"_fld) = 5;
 */

#pragma once

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include "boost/pfr.hpp"
#include "fixed_string.hpp"
#include "CxxUtilities.hpp"
#include "editable_detail.hpp"

namespace editable
{

/// Version of the library, read by packaging tooling
inline constexpr std::string_view kVersion = "1.3.1";

/**
 * @brief The absent sentinel
 *
 * Fields with neither a supplied value nor a default hold Absent. It prints
 * as "None" and is equal only to itself.
 */
struct Absent
{
    friend constexpr bool operator==(Absent, Absent) noexcept { return true; }
};

inline constexpr Absent kAbsent = {};

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

class Value;
class Schema;
class Record;
template <typename T> class TypedRecord;

//=============================================================================
// Values
//=============================================================================

/**
 * @brief Dynamically typed value stored in a record field
 *
 * A Value holds one of the SupportedFundamentalTypes. Comparison follows the
 * usual dynamic-language rules:
 *   - bool, integers and doubles compare by numeric value (1 == 1.0 == true)
 *   - strings compare by content, Absent only equals Absent
 *   - values of other kinds are unequal, and ordering them throws TypeError
 */
class Value
{
public:
    /// Tuple of all types a Value can hold
    using SupportedFundamentalTypes = std::tuple<
        Absent,
        bool,
        std::int64_t,
        double,
        std::string
    >;

    /// Default constructor - holds the absent sentinel
    Value() = default;

    Value(Absent) {}
    Value(bool b) : underlying(b) {}

    /// Any integer type is stored as std::int64_t
    template <std::integral T> requires (! std::is_same_v<T, bool>)
    Value(T i) : underlying(static_cast<std::int64_t>(i)) {}

    /// Any floating point type is stored as double
    template <std::floating_point T>
    Value(T d) : underlying(static_cast<double>(d)) {}

    Value(std::string s) : underlying(std::move(s)) {}
    Value(std::string_view s) : underlying(std::string(s)) {}
    Value(char const* s) : underlying(std::string(s)) {}

    /// Returns true if this value is the absent sentinel
    bool isAbsent() const noexcept { return std::holds_alternative<Absent>(underlying); }

    /// Returns true if this value is a bool, an integer or a double
    bool isNumber() const noexcept;

    /// Returns the std::type_info of the held type
    std::type_info const& type() const;

    /// Returns the dynamic-language name of the held type ("NoneType", "bool", "int", "float", "str")
    std::string_view typeName() const noexcept;

    /// Returns true if this value currently holds a T
    template <typename T>
    bool is() const noexcept { return std::holds_alternative<T>(underlying); }

    /**
     * @brief Access the held value as a T
     * @throws TypeError if the value does not hold a T
     */
    template <typename T>
    T const& as() const;

    /// Returns the numeric value of a bool, integer or double, empty otherwise
    std::optional<double> number() const noexcept;

    /**
     * @brief Visit the underlying value with a type-safe lambda
     *
     * The lambda is called with the held value if it accepts that type; it
     * may accept any subset of SupportedFundamentalTypes. Returns the lambda's
     * result wrapped in an optional, which is empty if the lambda does not
     * accept the held type. If the lambda returns void, a bool indicating
     * whether it was called is returned instead.
     *
     * @code
     * value.visit([](auto const& v) { std::cout << v; });          // generic visitor
     * auto twice = value.visit([](std::int64_t i) { return 2 * i; }); // integers only
     * @endcode
     */
    template <typename Lambda>
    auto visit(this auto&& self, Lambda && lambda);

    /// Source-like representation: None, True, 42, 0.5, 'text'
    std::string repr() const;

    /// Display form: like repr() but strings are not quoted
    std::string str() const;

    friend bool operator==(Value const& lhs, Value const& rhs);

    /**
     * @brief Arithmetic with the usual numeric promotion
     *
     * Integers and bools give an integer, anything involving a double gives a
     * double, and + concatenates strings.
     *
     * @throws TypeError for any other combination of types
     * @throws OverflowError if an integer result does not fit into std::int64_t
     */
    friend Value operator+(Value const& lhs, Value const& rhs);
    friend Value operator-(Value const& lhs, Value const& rhs);

    /**
     * @brief Three-way comparison
     *
     * Numbers order numerically (NaN is unordered), strings lexicographically.
     *
     * @throws TypeError for any other combination of types
     */
    friend std::partial_ordering operator<=>(Value const& lhs, Value const& rhs);

private:
    detail::apply_tuple<std::variant, SupportedFundamentalTypes>::type underlying;
};

//=============================================================================
// Errors
//=============================================================================

/// Base class of every error raised by this library
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Error kinds which carry nothing beyond their message
template <typename>
class NamedError : public Error
{
public:
    using Error::Error;
};

/// Malformed schema definition: no fields, duplicate or invalid field names, too many defaults
using ConfigurationError = NamedError<class configuration_error_tag>;

/// Too many values supplied to construct a record
using ArityError = NamedError<class arity_error_tag>;

/// Field deletion, or positional access on a non-indexable record
using OperationNotSupportedError = NamedError<class operation_not_supported_error_tag>;

/// Values of incompatible types were ordered or combined, Value::as<T>() was asked for the
/// wrong type, or a record was assigned a record of an incompatible schema
using TypeError = NamedError<class type_error_tag>;

/// Integer arithmetic left the range of std::int64_t
using OverflowError = NamedError<class overflow_error_tag>;

/// Reference to a field name which is not part of the schema
class UnknownFieldError : public Error
{
public:
    UnknownFieldError(std::string_view typeName, std::string_view fieldname);

    std::string const& fieldname() const noexcept { return field; }

private:
    std::string field;
};

/// Out-of-range positional access
class IndexError : public Error
{
public:
    IndexError(std::ptrdiff_t index, std::size_t size);
    explicit IndexError(std::string const& message);

    std::ptrdiff_t index() const noexcept { return idx; }
    std::size_t size() const noexcept { return length; }

private:
    std::ptrdiff_t idx = 0;
    std::size_t length = 0;
};

/**
 * @brief A validator rejected a value
 *
 * Validators throw this to refuse a candidate value. The message defaults to
 * a description of the field and the offending value.
 */
class ValidationError : public Error
{
public:
    ValidationError(std::string_view fieldname, Value offending);
    ValidationError(std::string_view fieldname, Value offending, std::string const& message);

    std::string const& fieldname() const noexcept { return field; }
    Value const& value() const noexcept { return offending; }

private:
    std::string field;
    Value offending;
};

/// Builds an error of type E with a std::format message
template <typename E, typename... Args>
E makeError(std::format_string<Args...> fmt, Args&&... args)
{
    return E{std::format(fmt, std::forward<Args>(args)...)};
}

//=============================================================================
// Schema
//=============================================================================

/// Ordered field name to value pairs: the dict projection and the named construction arguments
using Dict = std::vector<std::pair<std::string, Value>>;

/**
 * @brief Function consulted on every field write
 *
 * Called with the field name and the candidate value. Returns the value to
 * store (the candidate itself or a substitute), or throws ValidationError to
 * refuse the write.
 */
using Validator = std::function<Value(std::string_view fieldname, Value const& candidate)>;

/**
 * @brief Selects which access protocols the records of a schema support
 */
enum class Flavor
{
    indexable,  ///< named access plus index, slice, iteration, size and contains
    plain       ///< named access only; use Record::toTuple() for a positional view
};

/**
 * @brief Describes a single field of a Schema
 */
struct FieldDescriptor
{
    std::string fieldname;
    Value defaultValue;
};

/**
 * @brief Python-style slice over the field indices of a record
 *
 * Missing bounds default to the start/end of the record (respecting the sign
 * of step), negative bounds count from the end and out-of-range bounds are
 * clamped.
 *
 * @code
 * record.slice({.stop = 3});               // first three fields
 * record.slice({.start = -1, .step = -1}); // all fields, last to first
 * @endcode
 */
struct Slice
{
    std::optional<std::ptrdiff_t> start = {};
    std::optional<std::ptrdiff_t> stop = {};
    std::ptrdiff_t step = 1;

    /**
     * @brief Resolves the slice against a sequence of the given length
     * @throws IndexError if step is zero
     */
    std::vector<std::size_t> indices(std::size_t length) const;
};

/// Optional parts of a schema definition
struct SchemaOptions
{
    /// Defaults aligned with the fields; missing trailing entries are Absent
    std::vector<Value> defaults = {};

    /// Consulted on every write; may be empty
    Validator validator = {};

    Flavor flavor = Flavor::indexable;
};

/**
 * @brief Immutable definition of a record type
 *
 * A Schema holds the type name, the ordered field descriptors (name and
 * default value), the optional validator and the flavor. It is created once
 * by define() or fromStruct(), shared by every Record constructed from it and
 * never modified afterwards, so it may be read from several threads.
 *
 * @code
 * auto Point = Schema::define("Point", "x y");
 * auto p = Point->construct({3, 4});
 * @endcode
 */
class Schema : public std::enable_shared_from_this<Schema>
{
    struct private_constructor_t {};

public:
    using Ptr = std::shared_ptr<Schema const>;

    using Options = SchemaOptions;

    /**
     * @brief Define a new record type
     *
     * @param name       Type name used when printing records
     * @param fieldnames Ordered field names. A single entry is split on whitespace,
     *                   so {"x y z"} is the same as {"x", "y", "z"}.
     * @param options    Defaults, validator and flavor
     *
     * @throws ConfigurationError if the name is empty, there are no fields, a field
     *         name is not an identifier or is repeated, or there are more defaults
     *         than fields
     */
    static Ptr define(std::string name, std::vector<std::string> fieldnames, Options options = {});

    /// @overload Fields given as one whitespace separated string, e.g. "red green blue"
    template <typename Text> requires std::convertible_to<Text const&, std::string_view>
    static Ptr define(std::string name, Text const& fieldnames, Options options = {});

    /**
     * @brief Define a record type from an aggregate of Field<> members
     *
     * The field names are the Field<> members of T in declaration order and the
     * defaults are their initial values in a value-initialized T.
     */
    template <typename T>
    static Ptr fromStruct(std::string name, Validator validator = {}, Flavor flavor = Flavor::indexable);

    /// Use define() or fromStruct()
    Schema(private_constructor_t, std::string name, std::vector<FieldDescriptor> fieldDescriptors, Validator validator, Flavor flavor);

    Schema(Schema const&) = delete;
    Schema& operator=(Schema const&) = delete;

    std::string const& name() const noexcept { return typeName; }
    std::span<FieldDescriptor const> fields() const noexcept { return fieldDescriptors; }
    std::size_t size() const noexcept { return fieldDescriptors.size(); }
    Flavor flavor() const noexcept { return kind; }
    bool isIndexable() const noexcept { return kind == Flavor::indexable; }
    bool hasValidator() const noexcept { return static_cast<bool>(validator); }

    /// Returns the index of a field, or an empty optional if there is no such field
    std::optional<std::size_t> indexOf(std::string_view fieldname) const;

    /**
     * @brief Returns true if records of both schemas may be compared
     *
     * Requires the same type name and the same field names in the same order.
     */
    bool isCompatible(Schema const& other) const noexcept;

    /**
     * @brief Construct a record
     *
     * Every field is first written, in declaration order, with its positional
     * value if one was supplied, else its default. The named values are then
     * written in the order given. Each write goes through the validator.
     *
     * Nothing is returned if any write fails: the error propagates and the
     * partially written values are discarded.
     *
     * @throws ArityError if more values than fields are supplied
     * @throws UnknownFieldError if a named value does not match a field
     * @throws whatever the validator throws
     */
    Record construct(std::vector<Value> positional = {}, Dict named = {}) const;

private:
    friend class Record;

    /// Runs the validator, if any, for the field at idx
    Value validate(std::size_t idx, Value candidate) const;

    std::string typeName;
    std::vector<FieldDescriptor> fieldDescriptors;
    std::map<std::string, std::size_t, std::less<>> lookup;
    Validator validator;
    Flavor kind;
};

//=============================================================================
// Records
//=============================================================================

/**
 * @brief A mutable instance of a Schema
 *
 * Records hold one Value per schema field. All writes, whether by name, index
 * or slice, go through the schema's validator; a rejected write leaves the
 * field unchanged. Fields can never be added or removed.
 *
 * Index, slice, iteration, size() and contains() are only available for
 * Flavor::indexable schemas and throw OperationNotSupportedError otherwise.
 *
 * Records are compared by value: two records are equal if their schemas are
 * compatible (see Schema::isCompatible) and all their values are equal.
 * Records of incompatible schemas are unordered. No std::hash is provided as
 * records are mutable.
 */
class Record
{
public:
    /**
     * @brief Writable reference to one field of a record
     *
     * Assigning to a FieldRef goes through the schema's validator.
     */
    class FieldRef
    {
    public:
        FieldRef(FieldRef const&) = default;

        /// Validate and store a new value
        FieldRef& operator=(Value newValue);

        /// Copies the value of another field (through the validator)
        FieldRef& operator=(FieldRef const& o) { return *this = Value(o.get()); }

        /// Read-modify-write through the validator, e.g. record("zoom") -= 0.1
        FieldRef& operator+=(Value const& operand) { return *this = get() + operand; }
        FieldRef& operator-=(Value const& operand) { return *this = get() - operand; }

        /// Stores lambda(current value) through the validator
        template <typename Lambda>
        FieldRef& update(Lambda && lambda) { return *this = Value(lambda(get())); }

        Value const& get() const;
        operator Value const&() const { return get(); }

        std::string_view fieldname() const;

        friend bool operator==(FieldRef const& lhs, Value const& rhs) { return lhs.get() == rhs; }

    private:
        friend class Record;
        template <typename> friend class TypedRecord;

        FieldRef(Record& record_, std::size_t idx_) : record(record_), idx(idx_) {}

        Record& record;
        std::size_t idx;
    };

    using const_iterator = std::vector<Value>::const_iterator;

    Record(Record const&) = default;
    Record(Record&&) noexcept = default;

    /**
     * @brief Replace this record by a copy of another one
     *
     * Only records of compatible schemas (see Schema::isCompatible) may be
     * assigned to each other, so the field layout of a record never changes.
     *
     * @throws TypeError if the schemas are not compatible
     */
    Record& operator=(Record const& o);
    Record& operator=(Record&& o);

    /// Returns the schema this record was constructed from
    Schema const& schema() const noexcept { return *meta; }

    /// Returns the shared handle to the schema this record was constructed from
    Schema::Ptr const& sharedSchema() const noexcept { return meta; }

    /// Returns the type name of the schema
    std::string const& typeName() const noexcept { return meta->name(); }

    //=============================================================================
    // Access by field name
    //=============================================================================

    /**
     * @brief Read a field by name
     * @throws UnknownFieldError if the schema has no such field
     */
    Value const& get(std::string_view fieldname) const;

    /**
     * @brief Write a field by name
     *
     * The stored value is whatever the validator returns for newValue. If the
     * validator throws, the field keeps its previous value.
     *
     * @throws UnknownFieldError if the schema has no such field
     */
    void set(std::string_view fieldname, Value newValue);

    /// Same as get()
    Value const& operator()(std::string_view fieldname) const { return get(fieldname); }

    /// Writable access to a field by name, e.g. record("x") = 5
    FieldRef operator()(std::string_view fieldname);

    /// Fields can never be removed: always throws OperationNotSupportedError
    void removeField(std::string_view fieldname);

    /**
     * @brief Visit all fields with a lambda
     *
     * @param lambda Callable taking (std::string_view name, Value const& value)
     */
    template <typename Lambda>
    void visitFields(Lambda && lambda) const;

    /**
     * @brief Visit a single field by runtime name without throwing
     *
     * Returns whatever the lambda returns wrapped in an optional. If there is
     * no field with this name then this method returns an empty optional.
     * If the lambda does not return anything, then this method returns a bool,
     * with true indicating success.
     */
    template <typename Lambda>
    auto visitField(std::string_view fieldname, Lambda && lambda) const;

    //=============================================================================
    // Positional access (Flavor::indexable only)
    //=============================================================================

    /// Number of fields
    std::size_t size() const;

    /**
     * @brief Read a field by index
     *
     * Negative indices count from the end, i.e. at(-1) is the last field.
     *
     * @throws IndexError if the index is out of range
     */
    Value const& at(std::ptrdiff_t index) const;

    /// Write a field by index (see at() and set())
    void setAt(std::ptrdiff_t index, Value newValue);

    Value const& operator[](std::ptrdiff_t index) const { return at(index); }
    FieldRef operator[](std::ptrdiff_t index);

    /// Returns a copy of the values selected by the slice
    std::vector<Value> slice(Slice const& range) const;

    /**
     * @brief Write the fields selected by the slice
     *
     * newValues[k] is written to the k-th selected field, in ascending k, until
     * either the selection or newValues runs out. Writes made before a rejected
     * value are kept.
     */
    void assignSlice(Slice const& range, std::span<Value const> newValues);

    /// Fields can never be removed: always throws OperationNotSupportedError
    void removeAt(std::ptrdiff_t index);

    /// Fields can never be removed: always throws OperationNotSupportedError
    void removeSlice(Slice const& range);

    /// Returns true if any field is equal to value
    bool contains(Value const& value) const;

    const_iterator begin() const;
    const_iterator end() const;

    //=============================================================================
    // Projections
    //=============================================================================

    /// Values in field order
    std::vector<Value> toTuple() const;

    /// (field name, value) pairs in field order
    Dict toDict() const;

    /// TypeName(field1=repr1, field2=repr2, ...)
    std::string describe() const;

    friend bool operator==(Record const& lhs, Record const& rhs);

    /**
     * @brief Lexicographic comparison of the field values
     *
     * Returns unordered for records of incompatible schemas, so that <, >, <=
     * and >= are all false between them.
     *
     * @throws TypeError if the first pair of unequal values cannot be ordered
     */
    friend std::partial_ordering operator<=>(Record const& lhs, Record const& rhs);

private:
    friend class Schema;
    template <typename> friend class TypedRecord;

    Record(Schema::Ptr schema_, std::vector<Value> values_);

    std::size_t indexOf(std::string_view fieldname) const;
    void requireCompatible(Record const& o) const;
    std::size_t resolveIndex(std::ptrdiff_t index) const;
    void requireIndexable(std::string_view operation) const;
    void store(std::size_t idx, Value newValue);

    Schema::Ptr meta;
    std::vector<Value> values;
};

//=============================================================================
// Compile-time layouts
//=============================================================================

/**
 * @brief Named field declaration for use as struct members
 *
 * A struct whose members are Field<"name"> declarations describes a record
 * layout. The member initializer is the field's default value.
 *
 * @code
 * struct Rgb {
 *     Field<"red">   red   {0};
 *     Field<"green"> green {0};
 *     Field<"blue">  blue  {0};
 * };
 * @endcode
 */
template <fixstr::fixed_string Name>
struct Field
{
    static constexpr std::string_view fieldname() { return Name; }

    Value initial = {};
};

/**
 * @brief User-defined literal for creating compile-time field name tags
 *
 * @code
 * point("x"_fld) = 3;
 * @endcode
 *
 * @return CompileTimeString containing the field name
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

/**
 * @brief A Record whose layout is the aggregate T
 *
 * TypedRecord adds compile-time checked field access via operator()(CompileTimeString)
 * using the "_fld" literal. Accessing a name that is not a Field<> member of T
 * does not compile.
 *
 * @tparam T A struct whose members are Field<"name"> declarations
 *
 * @code
 * struct Point {
 *     Field<"x"> x;
 *     Field<"y"> y;
 * };
 *
 * TypedRecord<Point> point(Schema::fromStruct<Point>("Point"), {3, 4});
 * point("x"_fld) = 5;
 * @endcode
 */
template <typename T>
class TypedRecord : public Record
{
private:
    static auto fields_with(T& u);
    static auto fields_with(T const& u);

public:
    /// Tuple type of references to all Field<> members
    using ReferenceTuple = decltype(fields_with(std::declval<T&>()));

    /// Tuple type of all Field<> member types
    using FieldsAsTuple = typename detail::decay_tuple<ReferenceTuple>::type;
    static_assert(std::tuple_size_v<FieldsAsTuple> >= 1);

    /// Compile-time array of all field names in declaration order
    static constexpr std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> kFieldNames =
        std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
        {
            std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> returnValue = {{
                Types::fieldname()...
            }};

            return returnValue;
        }, std::type_identity<FieldsAsTuple>());

    /// Same as Schema::fromStruct<T>()
    static Schema::Ptr define(std::string name, Validator validator = {}, Flavor flavor = Flavor::indexable);

    /**
     * @brief Adopt a record
     * @throws ConfigurationError if the record's fields are not the Field<> members of T
     */
    explicit TypedRecord(Record record);

    /// Construct a new record of the given schema (see Schema::construct)
    TypedRecord(Schema::Ptr const& schema, std::vector<Value> positional = {}, Dict named = {});

    using Record::operator();

    /// Read a field by compile-time name
    template <fixstr::fixed_string FieldName>
    Value const& operator()(CompileTimeString<FieldName>) const;

    /// Writable access to a field by compile-time name
    template <fixstr::fixed_string FieldName>
    FieldRef operator()(CompileTimeString<FieldName>);

private:
    template <fixstr::fixed_string FieldName>
    static constexpr std::size_t fieldIndex();
};

// Stream output operators
std::ostream& operator<<(std::ostream& o, Value const& x);
std::ostream& operator<<(std::ostream& o, Record const& x);
} // namespace editable

// std::formatter specializations
template <>
struct std::formatter<editable::Value> : std::formatter<std::string>
{
    auto format(editable::Value const& v, format_context& ctx) const;
};

template <>
struct std::formatter<editable::Record> : std::formatter<std::string>
{
    auto format(editable::Record const& r, format_context& ctx) const;
};

template <typename T>
struct std::formatter<editable::TypedRecord<T>> : std::formatter<editable::Record> {};

// Include template implementations
#include "editable.tpp"
