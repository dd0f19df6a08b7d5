/**
 * @file reflector.hpp
 * @brief Runtime value introspection, conversion and comparison
 *
 * Any value can be wrapped in a type-erased Value handle that knows the value's
 * Kind and MetaType. On top of that handle the library offers:
 *   - Kind predicates and nil/zero/empty checks that never fault
 *   - A conversion engine that coerces between numbers, text, booleans,
 *     timestamps, pointers and sequences with a fixed precedence of rules
 *   - A comparison engine relating two arbitrarily typed values
 *   - StructView and SequenceView for structured access to records and vectors
 *
 * Records are plain structs whose members are wrapped in Field<T, Name>:
 *   struct Point {
 *       Field<float, "x"> x;
 *       Field<float, "y"> y;
 *   };
 *   Point p;
 *   auto view = reflect(&p).mustStruct();
 *   view.setFieldValue("x", "3.5", true);  // p.x() == 3.5f
 *
 * Failures are reported as Result<T> (std::expected with an Error). Only the
 * must* variants throw.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <sstream>
#include <type_traits>
#include <concepts>
#include <map>
#include <vector>
#include <deque>
#include <mutex>
#include <iostream>
#include <cstddef>
#include <span>
#include <utility>
#include <variant>
#include <optional>
#include <expected>
#include <stdexcept>
#include <functional>
#include <format>
#include <chrono>
#include <typeinfo>
#include <boost/core/demangle.hpp>
#include <spdlog/spdlog.h>
#include "fixed_string.hpp"
#include "CxxUtilities.hpp"
#include "reflector_detail.hpp"

namespace reflector
{

//=============================================================================
// Kinds
//=============================================================================

/**
 * @brief Coarse classification of a type
 *
 * Every reflected C++ type maps to exactly one kind. Enumerations and
 * std::chrono durations take the kind of their underlying arithmetic type.
 */
enum class Kind
{
    invalid,
    boolean,
    int8,
    int16,
    int32,
    int64,
    uint8,
    uint16,
    uint32,
    uint64,
    float32,
    float64,
    string,
    record,
    sequence,
    array,
    map,
    pointer,
    dynamic,
    function,
    channel,
    other
};

std::string_view toString(Kind kind);

constexpr bool isNumericKind(Kind kind) noexcept    { return kind >= Kind::int8 && kind <= Kind::float64; }
constexpr bool isSignedKind(Kind kind) noexcept     { return kind >= Kind::int8 && kind <= Kind::int64; }
constexpr bool isUnsignedKind(Kind kind) noexcept   { return kind >= Kind::uint8 && kind <= Kind::uint64; }
constexpr bool isFloatingKind(Kind kind) noexcept   { return kind == Kind::float32 || kind == Kind::float64; }

//=============================================================================
// Errors
//=============================================================================

/// The closed set of failure categories
enum class ErrorKind
{
    invalidValue,
    typeMismatch,
    unconvertible,
    invalidTime,
    unsettable,
    notARecord,
    notASequence,
    unknownField,
    unknownOperator,
    invalidComparison,
    indexOutOfBounds,
    cannotAppendToNonReference
};

/// Stable snake_case tag of an error kind, e.g. "type_mismatch"
std::string_view toString(ErrorKind kind);

/**
 * @brief A typed failure
 *
 * The kind identifies the failure category, the detail carries a human
 * readable explanation (which may be empty).
 */
struct Error
{
    ErrorKind kind;
    std::string detail;

    /// "tag: detail", or just the tag if there is no detail
    std::string message() const;
};

template <typename T>
using Result = std::expected<T, Error>;

/// Shorthand for returning a failure from a function returning Result<T>
std::unexpected<Error> fail(ErrorKind kind, std::string detail = {});

/**
 * @brief Exception thrown by the must* convenience variants
 */
class Exception : public std::runtime_error
{
public:
    explicit Exception(Error err);

    Error const& error() const noexcept { return err; }

private:
    Error err;
};

//=============================================================================
// Timestamps
//=============================================================================

/// The canonical timestamp type
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

/**
 * @brief Parse an RFC 3339 timestamp, e.g. "2012-05-23T18:30:00.000-05:00"
 *
 * The zone offset is applied so the result is always UTC. Fractional seconds
 * of any length are accepted, digits beyond nanoseconds are ignored.
 */
Result<Timestamp> parseTimestamp(std::string_view text);

/// Format a timestamp as RFC 3339 in UTC, e.g. "2012-05-23T23:30:00Z"
std::string formatTimestamp(Timestamp ts);

//=============================================================================
// MetaType system
//=============================================================================

class MetaType;

/// A number in its widest representation of the same family
using Number = std::variant<std::int64_t, std::uint64_t, double>;

/**
 * @brief Describes a single field within a record's MetaType
 *
 * Provides the field name, a function pointer to lazily obtain the MetaType
 * of the field's underlying type (avoiding static initialization order issues
 * with recursive/nested types) and an accessor returning the field's storage
 * inside a record instance.
 */
struct FieldDescriptor
{
    std::string_view fieldname;
    MetaType const& (*metaType)();
    void* (*access)(void* record);
};

/**
 * @brief Result of following a pointer or unwrapping a dynamic box
 */
struct Indirection
{
    /// How the addressability of the target relates to its holder
    enum class Access
    {
        independent,  ///< target lives in separate storage and is always writable (pointers)
        embedded,     ///< target lives inside its holder (std::optional)
        readOnly      ///< target must not be written through this path (dynamic boxes)
    };

    void* target = nullptr;
    MetaType const* type = nullptr;
    Access access = Access::readOnly;
};

/**
 * @brief Type-erased descriptor of a C++ type
 *
 * There is exactly one MetaType per type, obtained via typeOf<T>(). Besides
 * classification it provides the raw storage operations the engines are built
 * on. All storage pointers passed to these operations must point to an object
 * of the described type.
 */
class MetaType
{
public:
    virtual ~MetaType() = default;

    /// Returns the std::type_info for the described type
    virtual std::type_info const& typeInfo() const = 0;

    /// Returns the coarse classification of the type
    virtual Kind kind() const = 0;

    /// Returns a human readable (demangled) name of the type
    virtual std::string name() const = 0;

    virtual bool isTimestamp() const { return false; }
    virtual bool isDuration() const  { return false; }
    virtual bool isBytes() const     { return false; }

    /**
     * @brief Returns field descriptors for record types
     *
     * The span is in declaration order and empty for all other kinds.
     */
    virtual std::span<FieldDescriptor const> fields() const { return {}; }

    /// Returns the descriptor of the field with the given name or nullptr
    FieldDescriptor const* field(std::string_view fieldname) const;

    /**
     * @brief Returns the MetaType of the contained elements
     *
     * Element type for sequences, arrays and channels, value type for maps and
     * the pointee type for pointers. nullptr for all other kinds.
     */
    virtual MetaType const* elementMetaType() const { return nullptr; }

    /// Key type of maps, nullptr otherwise
    virtual MetaType const* keyMetaType() const { return nullptr; }

    /// The MetaType of T* if T is not itself a pointer, nullptr otherwise
    virtual MetaType const* pointerMetaType() const { return nullptr; }

    //-------------------------------------------------------------------------
    // storage operations

    /// Allocates a default constructed instance, nullptr if T is not default constructible
    virtual std::shared_ptr<void> construct() const = 0;

    /// Allocates a copy of src, nullptr if T is not copy constructible
    virtual std::shared_ptr<void> duplicate(void const* src) const = 0;

    /// Copy-assigns src to dst, returns false if T is not copy assignable
    virtual bool assign(void* dst, void const* src) const = 0;

    /// Deep equality
    virtual bool equal(void const* a, void const* b) const = 0;

    /// True if the value equals the zero value of its type (or is nil)
    virtual bool isZero(void const* p) const = 0;

    /// Generic human-readable formatting
    virtual void print(std::ostream& o, void const* p) const = 0;

    /// The text of textual types, byte sequences and types with a toString() member
    virtual std::optional<std::string> text(void const*) const { return {}; }

    /// Replaces the content of a textual type or byte sequence
    virtual bool assignText(void*, std::string_view) const { return false; }

    /// The numeric value of numeric kinds
    virtual std::optional<Number> number(void const*) const { return {}; }

    /// Stores a number, false if it is not representable in the type
    virtual bool assignNumber(void*, Number) const { return false; }

    //-------------------------------------------------------------------------
    // nil-able and indirecting kinds

    virtual bool isNil(void const*) const { return false; }

    /// Follows a pointer or unwraps a dynamic box. target is nullptr if nil.
    virtual Indirection indirect(void*) const { return {}; }

    /// Pointer kinds: creates a pointer instance that refers to (and keeps alive) pointee
    virtual std::shared_ptr<void> pointerTo(std::shared_ptr<void> /*pointee*/) const { return nullptr; }

    /// Pointer kinds: true if the pointer type manages the lifetime of its pointee
    virtual bool ownsPointee() const { return false; }

    /// Dynamic kind: stores a copy of a value of any type in the box
    virtual bool box(void* /*dst*/, MetaType const& /*type*/, void const* /*src*/) const { return false; }

    //-------------------------------------------------------------------------
    // containers

    virtual std::size_t length(void const*) const { return 0; }
    virtual std::size_t capacity(void const* p) const { return length(p); }

    /// Element storage of sequences and arrays, nullptr if out of range
    virtual void* index(void*, std::size_t) const { return nullptr; }

    /// Appends a copy of an element (of elementMetaType()) to a sequence
    virtual bool append(void*, void const* /*element*/) const { return false; }

    /// Map lookup, nullptr if absent
    virtual void* find(void*, void const* /*key*/) const { return nullptr; }

    /// Map insert or overwrite
    virtual bool insert(void*, void const* /*key*/, void const* /*value*/) const { return false; }

    /// Map entries in key order
    virtual std::vector<std::pair<void const*, void*>> entries(void*) const { return {}; }
};

/// Two MetaTypes are equal if they describe the same C++ type
bool operator==(MetaType const& a, MetaType const& b);

/**
 * @brief Get the MetaType for a given C++ type T
 *
 * @tparam T The type to get metadata for
 * @return Reference to the MetaType singleton for T
 */
template <typename T>
MetaType const& typeOf();

template <>
MetaType const& typeOf<Any>();

/// The MetaType of the absent sentinel
MetaType const& invalidMetaType();

//=============================================================================
// Record fields
//=============================================================================

/**
 * @brief A named member of a record
 *
 * Wrap every member of a struct that should be visible to the reflection
 * system in a Field. The name is part of the type.
 *
 * @code
 * struct Person {
 *     Field<std::string, "name"> name;
 *     Field<int, "age"> age;
 * };
 * @endcode
 *
 * A record field with an empty name is embedded: its fields are found by name
 * through the outer record (unless the outer record declares the same name)
 * and StructView::toMap() merges them into the outer map.
 */
template <typename T, fixstr::fixed_string Name>
class Field
{
public:
    using Type = T;
    static constexpr std::string_view kName = std::string_view(Name);

    /// Default constructor - creates a Field with value-initialized content
    Field() = default;

    /// Assign new value to the field
    Field& operator=(T const& t)    { underlying = t; return *this; }

    /// Assign new value to the field (move version)
    Field& operator=(T && t)        { underlying = std::move(t); return *this; }

    /// Access to the wrapped value
    T const& operator()() const     { return underlying; }
    T&       operator()()           { return underlying; }

    operator T const&() const       { return underlying; }

    T const* operator->() const     { return &underlying; }
    T*       operator->()           { return &underlying; }

    /// Returns the compile-time field name as specified in the template parameter
    std::string_view fieldname() const { return kName; }

    friend bool operator==(Field const& a, Field const& b) requires std::equality_comparable<T>
    {
        return a.underlying == b.underlying;
    }

private:
    T underlying{};
};

//=============================================================================
// Channels
//=============================================================================

/**
 * @brief A bounded FIFO with reference semantics
 *
 * Copies share the same buffer. A default constructed channel is nil: it has
 * no buffer and rejects all operations.
 */
template <typename T>
class Channel
{
public:
    Channel() = default;

    /// Creates a channel buffering up to capacity elements
    static Channel make(std::size_t capacity);

    bool isNil() const { return state == nullptr; }

    /// Enqueues a value, false if the channel is nil or full
    bool trySend(T value);

    /// Dequeues the oldest value, nullopt if the channel is nil or empty
    std::optional<T> tryReceive();

    std::size_t size() const;
    std::size_t capacity() const;

    friend bool operator==(Channel const& a, Channel const& b) { return a.state == b.state; }

private:
    struct State
    {
        mutable std::mutex lock;
        std::deque<T> buffer;
        std::size_t capacity = 0;
    };

    std::shared_ptr<State> state;
};

//=============================================================================
// Dynamic box
//=============================================================================

/**
 * @brief Owning box for a value of any reflected type
 *
 * Copying an Any deep copies the boxed value. An empty Any is nil. Any is the
 * "dynamic" kind: a Field<Any, "x"> or a std::map<std::string, Any> holds
 * values whose type is only known at runtime.
 */
class Any
{
public:
    Any() = default;

    template <typename T>
        requires (! std::is_same_v<std::decay_t<T>, Any> && ! std::is_same_v<std::decay_t<T>, Value>
               && ! std::is_same_v<std::decay_t<T>, std::nullptr_t>)
    Any(T&& value);

    Any(std::nullptr_t) {}

    Any(Any const& o);
    Any(Any&& o) noexcept = default;
    Any& operator=(Any const& o);
    Any& operator=(Any&& o) noexcept = default;

    bool hasValue() const { return storage != nullptr; }
    explicit operator bool() const { return hasValue(); }

    /// MetaType of the boxed value, the invalid MetaType if empty
    MetaType const& metaType() const;

    std::type_info const& type() const { return metaType().typeInfo(); }

    /// Typed access, nullptr if empty or if the boxed type is not T
    template <typename T> T const* get() const;
    template <typename T> T*       get();

    friend bool operator==(Any const& a, Any const& b);

private:
    friend class Value;
    friend class AnyMeta;

    Any(MetaType const& type, std::shared_ptr<void> content);

    MetaType const* meta = nullptr;
    std::shared_ptr<void> storage;
};

class StructView;
class SequenceView;

//=============================================================================
// Value wrapper
//=============================================================================

/**
 * @brief Type-erased handle over one runtime value
 *
 * A Value is either valid (it has a MetaType and storage) or the absent
 * sentinel. Copies of a Value refer to the same storage. Values created with
 * reflect() own a private copy of their input and are not addressable;
 * dereferencing a pointer yields an addressable Value whose set() writes
 * through to the pointee.
 *
 * Introspection never fails. Operations that can fail return a Result.
 */
class Value
{
private:
    /// Tuple of all primitive types supported by the visitor pattern
    using SupportedFundamentalTypes = std::tuple<
        int8_t, int16_t, int32_t, int64_t,
        uint8_t, uint16_t, uint32_t, uint64_t,
        float, double,
        bool,
        std::string, Timestamp
    >;

public:
    /// The absent sentinel
    static Value const kInvalid;

    Value() = default;

    /**
     * @brief Wraps existing storage
     *
     * @param type     the MetaType describing the storage
     * @param data     pointer to an object of that type
     * @param owner    keeps the storage alive (may be empty for external storage)
     * @param writable whether set() may write to the storage
     *
     * Returns the absent sentinel if data is nullptr or type is the invalid type.
     */
    static Value fromStorage(MetaType const& type, void* data, std::shared_ptr<void> owner, bool writable);

    /// Allocates a fresh, addressable, default constructed value of the given type
    static Value create(MetaType const& type);

    /// Wraps a copy of the boxed value, the absent sentinel if the box is empty
    static Value fromAny(Any const& box);

    bool isValid() const { return meta != nullptr; }
    explicit operator bool() const { return isValid(); }

    /// Returns the MetaType, the invalid MetaType for the absent sentinel
    MetaType const& metaType() const;

    /// Returns the std::type_info of the underlying value, typeid(void) if absent
    std::type_info const& type() const { return metaType().typeInfo(); }

    Kind kind() const { return metaType().kind(); }

    /// True if set() may write to the underlying storage
    bool isAddressable() const { return addressable; }

    //-------------------------------------------------------------------------
    // classification

    bool isPointer() const          { return kind() == Kind::pointer; }
    bool isString() const           { return kind() == Kind::string; }
    bool isSequence() const         { return kind() == Kind::sequence; }
    bool isMap() const              { return kind() == Kind::map; }
    bool isRecord() const           { return kind() == Kind::record; }
    bool isDynamic() const          { return kind() == Kind::dynamic; }
    bool isChannel() const          { return kind() == Kind::channel; }
    bool isFunction() const         { return kind() == Kind::function; }
    bool isFixedArray() const       { return kind() == Kind::array; }
    bool isBoolean() const          { return kind() == Kind::boolean; }
    bool isNumeric() const          { return isNumericKind(kind()); }
    bool isTimestamp() const        { return metaType().isTimestamp(); }
    bool isDuration() const         { return metaType().isDuration(); }

    /// True for pointers whose pointee type is a record
    bool isRecordPointer() const;

    /// True for arrays, channels, maps, sequences and strings
    bool isIterable() const;

    /// Element count of iterable kinds, 0 for everything else
    std::size_t length() const;

    //-------------------------------------------------------------------------
    // nil, zero and empty

    /**
     * @brief True if the value holds an absence
     *
     * Only pointers, dynamic boxes, functions and channels can be nil. Standard
     * containers always exist and are never nil. The absent sentinel is nil.
     */
    bool isNil() const;

    /// True if nil or equal to the zero value of its type. Never true for sequences, arrays and maps.
    bool isZero() const;

    /// Like isZero() but follows pointers and dynamic boxes
    bool isDeepZero() const;

    /// True if zero, or if an array, channel, map or sequence has no elements
    bool isEmpty() const;

    //-------------------------------------------------------------------------
    // navigation

    /// The pointee of a pointer or the content of a dynamic box. Absent if nil or not indirecting.
    Value dereference() const;

    /// A pointer to this value's storage if addressable, absent otherwise
    Value address() const;

    /// Element of a sequence or array, absent if out of range or not indexable
    Value index(std::size_t i) const;

    /// Field of a record or of one of its embedded records, absent if there is no such field
    Value field(std::string_view name) const;

    /**
     * @brief Looks up a map entry
     *
     * The key is converted to the map's key type. Returns the absent sentinel
     * if this is not a map, the key is not convertible or there is no entry.
     */
    Value mapIndex(Value const& key) const;

    /**
     * @brief Inserts or overwrites a map entry
     *
     * Keys and values must match the map's types exactly unless allowConversion
     * is set. Maps are written in place regardless of addressability.
     */
    Result<void> setMapIndex(Value const& key, Value const& value, bool allowConversion = false);

    //-------------------------------------------------------------------------
    // access

    /// Typed read access, nullptr if absent or if the type is not exactly T
    template <typename T>
    T const* get() const;

    /// Raw storage pointer, nullptr for the absent sentinel
    void* unsafePointer() const { return data; }

    /// Deep copy into fresh, non-addressable storage
    Value clone() const;

    /// Boxes a copy of the value. For dynamic values the content is copied.
    Any toAny() const;

    /// Generic human-readable formatting
    std::string toString() const;

    /**
     * @brief Visit the underlying value with a type-safe lambda
     *
     * The lambda will be called with the underlying value if its exact type is
     * one of the supported fundamental types and the lambda accepts it.
     *
     * @return bool (whether the lambda was called) for void lambdas, otherwise
     *         an optional holding the lambda's result
     *
     * @code
     * value.visit([](auto const& v) { std::cout << v; });
     * auto doubled = value.visit([](int32_t i) { return i * 2; });
     * @endcode
     */
    template <typename Lambda>
    auto visit(Lambda && lambda) const;

    //-------------------------------------------------------------------------
    // equality, mutation, conversion and comparison

    /**
     * @brief Deep equality with a raw value, an Any or another Value
     *
     * Values of different types are never equal.
     */
    template <typename T>
    bool equals(T&& other) const;

    /**
     * @brief Writes a new value through to the underlying storage
     *
     * Fails with Unsettable if this Value is not addressable and with
     * TypeMismatch if the types differ and allowConversion is false. A dynamic
     * destination accepts any value.
     */
    Result<void> set(Value const& newValue, bool allowConversion = false);

    template <typename T>
    Result<void> setValue(T&& raw, bool allowConversion = false);

    /// set() that throws Exception on failure
    void mustSet(Value const& newValue, bool allowConversion = false);

    /// Converts to the given type, see the conversion rules in convertToType()
    Result<Value> convertToType(MetaType const& target) const;

    /// Converts to the type of a sample value, InvalidValue if the sample is absent
    template <typename T>
    Result<Value> convertTo(T&& sample) const;

    /// Converts and extracts a T
    template <typename T>
    Result<T> to() const;

    Value mustConvertToType(MetaType const& target) const;

    template <typename T>
    Value mustConvertTo(T&& sample) const;

    /// Relates this value to another one, see compare()
    template <typename T>
    Result<bool> compareTo(T&& other, std::string_view op) const;

    template <typename T>
    bool mustCompareTo(T&& other, std::string_view op) const;

    //-------------------------------------------------------------------------
    // structured views

    /// Promotes a record (or pointer to a record) to a StructView
    Result<StructView> toStruct() const;

    /// Promotes a sequence (or pointer to a sequence) to a SequenceView
    Result<SequenceView> toSequence() const;

    StructView mustStruct() const;
    SequenceView mustSequence() const;

private:
    Value(MetaType const& type, void* data_, std::shared_ptr<void> owner_, bool addressable_);

    /// A Value over child storage sharing this Value's owner
    Value child(MetaType const& type, void* childData, bool childAddressable) const;

    MetaType const* meta = nullptr;
    void* data = nullptr;
    std::shared_ptr<void> owner;
    bool addressable = false;
};

/**
 * @brief Wraps any value
 *
 * The value is copied (or moved) into storage owned by the returned Value,
 * which is therefore not addressable. Wrap a pointer and dereference() it to
 * obtain a Value that writes through to the caller's storage.
 *   - reflect(Value) returns the Value unchanged
 *   - reflect(Any) wraps a copy of the boxed value (absent if empty)
 *   - reflect(nullptr) and null character pointers return the absent sentinel
 *   - character pointers and string views are captured as std::string
 */
template <typename T>
Value reflect(T&& value);

//=============================================================================
// Conversion engine
//=============================================================================

/**
 * @brief Converts a value to the target type
 *
 * Rules are tried in order, the first matching rule wins:
 *   1. identical types: a copy
 *   2. sequence to sequence: element-wise conversion (TypeMismatch on failure)
 *   3. T to a pointer to T: a freshly allocated pointee
 *   4. pointer to T to T: a copy of the pointee (InvalidValue if nil)
 *   5. text to Timestamp (or pointer to Timestamp): RFC 3339 (InvalidTime)
 *   6. text to bool: y/yes/1 and n/no/0, case-insensitive and trimmed
 *   7. anything to text: byte sequences, toString() members, generic formatting
 *   8. text to numeric: parsed as a 64-bit float, then narrowed
 *   9. generic: numeric conversions, boxing into and unboxing out of Any,
 *      text to byte sequences (Unconvertible otherwise)
 */
Result<Value> convertToType(Value const& value, MetaType const& target);

/// Converts to the type of sample. InvalidValue if sample is absent.
Result<Value> convertTo(Value const& value, Value const& sample);

//=============================================================================
// Comparison engine
//=============================================================================

enum class Operator
{
    equal,
    notEqual,
    less,
    lessEqual,
    greater,
    greaterEqual,
    like
};

/// "=" and "==" both parse to Operator::equal. UnknownOperator for anything else.
Result<Operator> parseOperator(std::string_view op);

/// The canonical symbol of an operator
std::string_view toString(Operator op);

struct Comparison
{
    bool result;
    Operator op;
};

/**
 * @brief Relates two values
 *
 * Zero operands are replaced by 0.0. If the right operand is zero the
 * operands are swapped afterwards so that the non-zero operand is handled as
 * the left side. Pointers and dynamic boxes are followed one level,
 * timestamps compare by nanoseconds since the epoch and durations by their
 * count. If either side is numeric both are compared as doubles, if the left
 * side is text the right side is converted to text (like = substring), and
 * all remaining kinds only support = and !=.
 */
Result<Comparison> compare(Value const& a, Value const& b, std::string_view op);

//=============================================================================
// Struct view
//=============================================================================

/**
 * @brief Field-oriented access to a record
 *
 * Fields are writable if the record is addressable, i.e. if the view was
 * created through a pointer or with makeNew().
 */
class StructView
{
public:
    /// InvalidValue for absent values and nil pointers, NotARecord for everything but records
    static Result<StructView> of(Value const& value);

    /// The record itself
    Value const& value() const { return record; }

    MetaType const& metaType() const { return record.metaType(); }

    /// A view over a new default instance of the same record type
    Result<StructView> makeNew() const;

    /// The field with the given name, absent if there is none
    Value field(std::string_view name) const;

    bool hasField(std::string_view name) const;

    /// All fields in declaration order
    std::vector<std::pair<std::string_view, Value>> fields() const;

    /// Like field() but fails with UnknownField
    Result<Value> fieldValue(std::string_view name) const;

    Result<void> setField(std::string_view name, Value const& newValue, bool allowConversion = false);

    template <typename T>
    Result<void> setFieldValue(std::string_view name, T&& raw, bool allowConversion = false)
    {
        return setField(name, reflect(std::forward<T>(raw)), allowConversion);
    }

    /**
     * @brief Converts the record to a map of boxed field values
     *
     * Non-zero record (and record pointer) fields become nested maps. Zero
     * fields are stored as empty boxes unless omitZero is set, empty fields
     * are skipped if omitEmpty is set.
     */
    std::map<std::string, Any> toMap(bool omitZero = false, bool omitEmpty = false) const;

    /**
     * @brief Assigns fields from a map
     *
     * Unknown keys and empty or zero values are skipped. Nested maps populate
     * record fields recursively.
     */
    Result<void> fromMap(std::map<std::string, Any> const& data, bool allowConversion = false);

private:
    explicit StructView(Value recordValue) : record(std::move(recordValue)) {}

    Value record;
};

//=============================================================================
// Sequence view
//=============================================================================

/**
 * @brief Index-oriented access to a std::vector
 *
 * Elements are always writable since they live in the vector's backing
 * storage. Appending additionally requires the vector itself to be
 * addressable, i.e. the view was created through a pointer or with makeNew().
 */
class SequenceView
{
public:
    /// Predicates receive elements with dynamic boxes unwrapped
    using Predicate = std::function<Result<bool>(Value const&)>;
    using Less = std::function<Result<bool>(Value const&, Value const&)>;

    /// InvalidValue for absent values and nil pointers, NotASequence for everything but sequences
    static Result<SequenceView> of(Value const& value);

    /// The sequence itself
    Value const& value() const { return sequence; }

    MetaType const& metaType() const { return sequence.metaType(); }
    MetaType const& elementType() const { return *sequence.metaType().elementMetaType(); }

    std::size_t length() const;
    std::size_t capacity() const;
    bool canAppend() const { return sequence.isAddressable(); }

    /// A view over a new, empty, appendable sequence of the same type
    Result<SequenceView> makeNew() const;

    /// Element at i, absent if out of range
    Value index(std::size_t i) const;

    Result<void> setIndex(std::size_t i, Value const& newValue);

    template <typename T>
    Result<void> setIndexValue(std::size_t i, T&& raw) { return setIndex(i, reflect(std::forward<T>(raw))); }

    Result<void> swap(std::size_t i, std::size_t j);

    /// All elements, dynamic boxes unwrapped
    std::vector<Value> items() const;

    /**
     * @brief Appends values
     *
     * All values must have the element type. Nothing is appended if any of
     * them does not.
     */
    Result<void> append(std::span<Value const> values);

    template <typename... Ts>
    Result<void> appendValues(Ts&&... raw)
    {
        std::vector<Value> values { reflect(std::forward<Ts>(raw))... };
        return append(values);
    }

    /// Converts the whole sequence to another sequence type
    Result<Value> convertToType(MetaType const& sequenceType) const;

    template <typename E>
    Result<std::vector<E>> convertTo() const;

    /// A new sequence with the elements the predicate accepts
    Result<SequenceView> filterBy(Predicate const& predicate) const;

    /**
     * @brief Stable sort
     *
     * The sequence is left untouched if the predicate fails. Inconsistent
     * predicates produce an unspecified order but never fault.
     */
    Result<void> sortBy(Less const& less);

    /// Sorts records, record pointers or string-keyed maps by one field
    Result<void> sortByFieldFunc(std::string_view fieldname, Less const& less);

    /// sortByFieldFunc() with the "<" or ">" comparison
    Result<void> sortByField(std::string_view fieldname, bool ascending = true);

private:
    explicit SequenceView(Value sequenceValue) : sequence(std::move(sequenceValue)) {}

    Result<void> permute(std::vector<std::size_t> const& order);

    Value sequence;
};

/**
 * @brief Sorts a sequence of records (or record pointers) by a field
 *
 * Stricter than SequenceView::sortByField(): fails on empty sequences, on
 * non-record elements, on unknown fields and on fields which cannot be
 * compared with themselves.
 */
Result<void> sortRecords(SequenceView& view, std::string_view fieldname, bool ascending = true);

//=============================================================================
// Logging
//=============================================================================

/// The library's logger, named "reflector"
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

//=============================================================================
// Stream output
//=============================================================================
std::ostream& operator<<(std::ostream& o, Value const& x);
std::ostream& operator<<(std::ostream& o, Any const& x);
std::ostream& operator<<(std::ostream& o, Error const& x);
} // namespace reflector

// std::formatter specializations
template <>
struct std::formatter<reflector::Value> : std::formatter<std::string>
{
    auto format(reflector::Value const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(v.toString(), ctx);
    }
};

template <>
struct std::formatter<reflector::Any> : std::formatter<reflector::Value>
{
    auto format(reflector::Any const& v, format_context& ctx) const
    {
        return std::formatter<reflector::Value>::format(reflector::reflect(v), ctx);
    }
};

template <>
struct std::formatter<reflector::Error> : std::formatter<std::string>
{
    auto format(reflector::Error const& e, format_context& ctx) const
    {
        return std::formatter<std::string>::format(e.message(), ctx);
    }
};

// Include template implementations
#include "reflector.tpp"
