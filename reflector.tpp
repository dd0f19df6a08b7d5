#pragma once

#include <cmath>
#include <cstring>
#include <limits>

namespace reflector
{

//=============================================================================
// MetaType implementations
//=============================================================================
namespace detail
{
template <typename T>
std::string typeName()
{
    return boost::core::demangle(typeid(T).name());
}

template <typename T>
constexpr Kind kindOf()
{
    if constexpr (std::is_same_v<T, bool>)
        return Kind::boolean;
    else if constexpr (std::is_enum_v<T>)
        return kindOf<std::underlying_type_t<T>>();
    else if constexpr (is_duration<T>::value)
        return kindOf<typename T::rep>();
    else if constexpr (std::is_integral_v<T>)
    {
        constexpr std::size_t idx = sizeof(T) == 1 ? 0 : sizeof(T) == 2 ? 1 : sizeof(T) == 4 ? 2 : 3;
        constexpr Kind kSigned[]   = { Kind::int8,  Kind::int16,  Kind::int32,  Kind::int64 };
        constexpr Kind kUnsigned[] = { Kind::uint8, Kind::uint16, Kind::uint32, Kind::uint64 };
        return std::is_signed_v<T> ? kSigned[idx] : kUnsigned[idx];
    }
    else if constexpr (std::is_floating_point_v<T>)
        return sizeof(T) == sizeof(float) ? Kind::float32 : Kind::float64;
    else if constexpr (std::is_same_v<T, std::string>)
        return Kind::string;
    else
        return Kind::other;
}

//-----------------------------------------------------------------------------
// Numbers
//-----------------------------------------------------------------------------

template <typename T>
Number toNumber(T v)
{
    if constexpr (std::is_enum_v<T>)
        return toNumber(static_cast<std::underlying_type_t<T>>(v));
    else if constexpr (is_duration<T>::value)
        return toNumber(v.count());
    else if constexpr (std::is_floating_point_v<T>)
        return static_cast<double>(v);
    else if constexpr (std::is_signed_v<T>)
        return static_cast<std::int64_t>(v);
    else
        return static_cast<std::uint64_t>(v);
}

/// Floating point to integer truncates toward zero. NaN and out of range values are rejected.
template <typename T>
bool truncateFloat(T& dst, double d)
{
    constexpr auto kDigits = std::numeric_limits<T>::digits;
    auto const limit = std::ldexp(1.0, kDigits);

    if (std::isnan(d))
        return false;

    if constexpr (std::is_signed_v<T>)
    {
        if (d < -limit || d >= limit)
            return false;
    }
    else
    {
        if (d <= -1.0 || d >= limit)
            return false;
    }

    dst = static_cast<T>(std::trunc(d));
    return true;
}

/// Narrowing to a smaller floating point type overflows to infinity
template <typename T>
T narrowFloat(double d)
{
    if constexpr (sizeof(T) < sizeof(double))
    {
        if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<T>::max()))
            return std::copysign(std::numeric_limits<T>::infinity(), static_cast<T>(d > 0 ? 1 : -1));
    }

    return static_cast<T>(d);
}

template <typename T>
bool fromNumber(T& dst, Number const& n)
{
    if constexpr (std::is_enum_v<T>)
    {
        std::underlying_type_t<T> raw{};
        if (! fromNumber(raw, n))
            return false;

        dst = static_cast<T>(raw);
        return true;
    }
    else if constexpr (is_duration<T>::value)
    {
        typename T::rep raw{};
        if (! fromNumber(raw, n))
            return false;

        dst = T(raw);
        return true;
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        std::visit(cxxutils::multilambda(
            [&dst] (double d) { dst = narrowFloat<T>(d); },
            [&dst] (auto i)   { dst = static_cast<T>(i); }
        ), n);
        return true;
    }
    else
    {
        // integer to integer wraps around (two's complement)
        return std::visit(cxxutils::multilambda(
            [&dst] (double d) { return truncateFloat(dst, d); },
            [&dst] (auto i)   { dst = static_cast<T>(i); return true; }
        ), n);
    }
}

//-----------------------------------------------------------------------------
// Common base
//-----------------------------------------------------------------------------

template <typename T>
class MetaTypeBase : public MetaType
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::string name() const override               { return typeName<T>(); }

    MetaType const* pointerMetaType() const override
    {
        if constexpr (std::is_pointer_v<T>)
            return nullptr;
        else
            return &typeOf<T*>();
    }

    std::shared_ptr<void> construct() const override
    {
        if constexpr (std::is_default_constructible_v<T>)
            return std::make_shared<T>();
        else
            return nullptr;
    }

    std::shared_ptr<void> duplicate(void const* src) const override
    {
        if constexpr (std::is_copy_constructible_v<T>)
            return std::make_shared<T>(cast(src));
        else
            return nullptr;
    }

    bool assign(void* dst, void const* src) const override
    {
        if constexpr (std::is_copy_assignable_v<T>)
        {
            cast(dst) = cast(src);
            return true;
        }
        else
            return false;
    }

    std::optional<std::string> text(void const* p) const override
    {
        if constexpr (Stringer<T>)
            return std::string(cast(p).toString());
        else
            return {};
    }

protected:
    static T const& cast(void const* p) { return *static_cast<T const*>(p); }
    static T&       cast(void* p)       { return *static_cast<T*>(p); }
};

//-----------------------------------------------------------------------------
// Scalars: booleans, numbers, enums, durations, strings, timestamps and opaque types
//-----------------------------------------------------------------------------

template <typename T>
class ScalarMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;

public:
    static constexpr auto kKind = kindOf<T>();

    Kind kind() const override          { return kKind; }
    bool isTimestamp() const override   { return std::is_same_v<T, Timestamp>; }
    bool isDuration() const override    { return is_duration<T>::value; }

    bool equal(void const* a, void const* b) const override
    {
        if constexpr (std::equality_comparable<T>)
            return cast(a) == cast(b);
        else
            return a == b;
    }

    bool isZero(void const* p) const override
    {
        if constexpr (std::equality_comparable<T> && std::is_default_constructible_v<T>)
            return cast(p) == T{};
        else
            return false;
    }

    void print(std::ostream& o, void const* p) const override
    {
        if constexpr (std::is_same_v<T, bool>)
            o << (cast(p) ? "true" : "false");
        else if constexpr (std::is_same_v<T, Timestamp>)
            o << formatTimestamp(cast(p));
        else if constexpr (std::is_floating_point_v<T>)
            o << std::format("{}", cast(p));
        else if constexpr (isNumericKind(kKind))
            std::visit([&o] (auto n) { o << n; }, toNumber(cast(p)));
        else if constexpr (OStreamable<T>)
            o << cast(p);
        else
            o << "<" << this->name() << " Value>";
    }

    std::optional<std::string> text(void const* p) const override
    {
        if constexpr (std::is_same_v<T, std::string>)
            return cast(p);
        else
            return MetaTypeBase<T>::text(p);
    }

    bool assignText(void* p, std::string_view s) const override
    {
        if constexpr (std::is_same_v<T, std::string>)
        {
            cast(p).assign(s);
            return true;
        }
        else
            return false;
    }

    std::optional<Number> number(void const* p) const override
    {
        if constexpr (isNumericKind(kKind))
            return toNumber(cast(p));
        else
            return {};
    }

    bool assignNumber(void* p, Number n) const override
    {
        if constexpr (isNumericKind(kKind))
            return fromNumber(cast(p), n);
        else
            return false;
    }
};

//-----------------------------------------------------------------------------
// Records
//-----------------------------------------------------------------------------

template <typename T>
class RecordMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;

public:
    RecordMeta()
    {
        [this] <std::size_t... I> (std::index_sequence<I...>)
        {
            (addField<I>(), ...);
        }(std::make_index_sequence<boost::pfr::tuple_size_v<T>>());
    }

    Kind kind() const override { return Kind::record; }

    std::span<FieldDescriptor const> fields() const override { return descriptors; }

    bool equal(void const* a, void const* b) const override
    {
        for (auto const& fld : descriptors)
        {
            auto const& type = fld.metaType();
            if (! type.equal(fld.access(const_cast<void*>(a)), fld.access(const_cast<void*>(b))))
                return false;
        }

        return true;
    }

    bool isZero(void const* p) const override
    {
        static T const zero{};
        return equal(p, &zero);
    }

    void print(std::ostream& o, void const* p) const override
    {
        o << "{ ";
        auto first = true;

        for (auto const& fld : descriptors)
        {
            if (! std::exchange(first, false))
                o << ", ";

            o << "." << fld.fieldname << " = ";
            fld.metaType().print(o, fld.access(const_cast<void*>(p)));
        }

        o << " }";
    }

private:
    template <std::size_t I>
    void addField()
    {
        using Member = boost::pfr::tuple_element_t<I, T>;

        if constexpr (is_field<Member>::value)
        {
            descriptors.push_back(FieldDescriptor {
                .fieldname = Member::kName,
                .metaType = &typeOf<typename Member::Type>,
                .access = [] (void* record) -> void* { return &boost::pfr::get<I>(*static_cast<T*>(record))(); }
            });
        }
    }

    std::vector<FieldDescriptor> descriptors;
};

//-----------------------------------------------------------------------------
// Sequences, arrays and maps
//-----------------------------------------------------------------------------

template <typename T>
class SequenceMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;
    using Element = typename T::value_type;

public:
    Kind kind() const override                          { return Kind::sequence; }
    bool isBytes() const override                       { return kIsByte<Element>; }
    MetaType const* elementMetaType() const override    { return &typeOf<Element>(); }

    std::size_t length(void const* p) const override    { return cast(p).size(); }
    std::size_t capacity(void const* p) const override  { return cast(p).capacity(); }

    void* index(void* p, std::size_t i) const override
    {
        auto& v = cast(p);
        return i < v.size() ? static_cast<void*>(&v[i]) : nullptr;
    }

    bool append(void* p, void const* element) const override
    {
        if constexpr (std::is_copy_constructible_v<Element>)
        {
            cast(p).push_back(*static_cast<Element const*>(element));
            return true;
        }
        else
            return false;
    }

    bool equal(void const* a, void const* b) const override
    {
        auto const& x = cast(a);
        auto const& y = cast(b);

        if (x.size() != y.size())
            return false;

        auto const& element = typeOf<Element>();
        for (std::size_t i = 0; i < x.size(); ++i)
            if (! element.equal(&x[i], &y[i]))
                return false;

        return true;
    }

    bool isZero(void const*) const override { return false; }

    void print(std::ostream& o, void const* p) const override
    {
        auto const& element = typeOf<Element>();
        o << "[";

        for (std::size_t i = 0; i < cast(p).size(); ++i)
        {
            if (i > 0)
                o << ", ";

            element.print(o, &cast(p)[i]);
        }

        o << "]";
    }

    std::optional<std::string> text(void const* p) const override
    {
        if constexpr (kIsByte<Element>)
        {
            auto const& bytes = cast(p);
            return std::string(reinterpret_cast<char const*>(bytes.data()), bytes.size());
        }
        else
            return {};
    }

    bool assignText(void* p, std::string_view s) const override
    {
        if constexpr (kIsByte<Element>)
        {
            auto& bytes = cast(p);
            bytes.resize(s.size());
            std::memcpy(bytes.data(), s.data(), s.size());
            return true;
        }
        else
            return false;
    }
};

template <typename T>
class ArrayMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;
    using Element = typename T::value_type;

public:
    Kind kind() const override                          { return Kind::array; }
    MetaType const* elementMetaType() const override    { return &typeOf<Element>(); }
    std::size_t length(void const*) const override      { return std::tuple_size_v<T>; }

    void* index(void* p, std::size_t i) const override
    {
        return i < std::tuple_size_v<T> ? static_cast<void*>(&cast(p)[i]) : nullptr;
    }

    bool equal(void const* a, void const* b) const override
    {
        auto const& element = typeOf<Element>();
        for (std::size_t i = 0; i < std::tuple_size_v<T>; ++i)
            if (! element.equal(&cast(a)[i], &cast(b)[i]))
                return false;

        return true;
    }

    bool isZero(void const*) const override { return false; }

    void print(std::ostream& o, void const* p) const override
    {
        auto const& element = typeOf<Element>();
        o << "[";

        for (std::size_t i = 0; i < std::tuple_size_v<T>; ++i)
        {
            if (i > 0)
                o << ", ";

            element.print(o, &cast(p)[i]);
        }

        o << "]";
    }
};

template <typename T>
class MapMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;
    using Key = typename T::key_type;
    using Mapped = typename T::mapped_type;

public:
    Kind kind() const override                          { return Kind::map; }
    MetaType const* elementMetaType() const override    { return &typeOf<Mapped>(); }
    MetaType const* keyMetaType() const override        { return &typeOf<Key>(); }
    std::size_t length(void const* p) const override    { return cast(p).size(); }

    void* find(void* p, void const* key) const override
    {
        auto& m = cast(p);
        auto it = m.find(*static_cast<Key const*>(key));
        return it != m.end() ? static_cast<void*>(&it->second) : nullptr;
    }

    bool insert(void* p, void const* key, void const* value) const override
    {
        if constexpr (std::is_copy_assignable_v<Mapped>)
        {
            cast(p).insert_or_assign(*static_cast<Key const*>(key), *static_cast<Mapped const*>(value));
            return true;
        }
        else
            return false;
    }

    std::vector<std::pair<void const*, void*>> entries(void* p) const override
    {
        std::vector<std::pair<void const*, void*>> result;

        for (auto& [key, value] : cast(p))
            result.emplace_back(&key, &value);

        return result;
    }

    bool equal(void const* a, void const* b) const override
    {
        auto const& x = cast(a);
        auto const& y = cast(b);

        if (x.size() != y.size())
            return false;

        auto const& keyType = typeOf<Key>();
        auto const& valueType = typeOf<Mapped>();

        for (auto i = x.begin(), j = y.begin(); i != x.end(); ++i, ++j)
            if (! keyType.equal(&i->first, &j->first) || ! valueType.equal(&i->second, &j->second))
                return false;

        return true;
    }

    bool isZero(void const*) const override { return false; }

    void print(std::ostream& o, void const* p) const override
    {
        auto const& keyType = typeOf<Key>();
        auto const& valueType = typeOf<Mapped>();
        auto first = true;
        o << "{";

        for (auto const& [key, value] : cast(p))
        {
            if (! std::exchange(first, false))
                o << ", ";

            keyType.print(o, &key);
            o << ": ";
            valueType.print(o, &value);
        }

        o << "}";
    }
};

//-----------------------------------------------------------------------------
// Pointers: T*, std::shared_ptr<T> and std::optional<T>
//-----------------------------------------------------------------------------

template <typename T>
class PointerMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;
    using Pointee = std::remove_cv_t<typename pointee_of<T>::type>;

    static constexpr auto kIsOptional = is_optional<T>::value;

    static Pointee* target(T const& ptr)
    {
        if constexpr (kIsOptional)
            return ptr.has_value() ? const_cast<Pointee*>(&*ptr) : nullptr;
        else if constexpr (std::is_pointer_v<T>)
            return const_cast<Pointee*>(ptr);
        else
            return ptr.get();
    }

public:
    Kind kind() const override                          { return Kind::pointer; }
    MetaType const* elementMetaType() const override    { return &typeOf<Pointee>(); }
    bool ownsPointee() const override                   { return ! std::is_pointer_v<T>; }
    bool isNil(void const* p) const override            { return target(cast(p)) == nullptr; }
    bool isZero(void const* p) const override           { return isNil(p); }

    Indirection indirect(void* p) const override
    {
        auto* pointee = target(cast(p));

        if (pointee == nullptr)
            return {};

        return Indirection { .target = pointee,
                             .type = &typeOf<Pointee>(),
                             .access = kIsOptional ? Indirection::Access::embedded : Indirection::Access::independent };
    }

    std::shared_ptr<void> pointerTo(std::shared_ptr<void> pointee) const override
    {
        if constexpr (kIsOptional)
        {
            if constexpr (std::is_copy_constructible_v<Pointee>)
                return std::make_shared<T>(*static_cast<Pointee const*>(pointee.get()));
            else
                return nullptr;
        }
        else if constexpr (is_shared_ptr<T>::value)
            return std::make_shared<T>(std::static_pointer_cast<Pointee>(pointee));
        else
        {
            // the pointer keeps its pointee alive for as long as the pointer storage lives
            struct Holder { std::shared_ptr<void> pointee; T pointer; };
            auto* raw = static_cast<Pointee*>(pointee.get());
            auto holder = std::make_shared<Holder>(Holder { std::move(pointee), raw });
            return std::shared_ptr<void>(holder, &holder->pointer);
        }
    }

    bool equal(void const* a, void const* b) const override
    {
        auto* x = target(cast(a));
        auto* y = target(cast(b));

        if (x == nullptr || y == nullptr)
            return x == y;

        return x == y || typeOf<Pointee>().equal(x, y);
    }

    void print(std::ostream& o, void const* p) const override
    {
        auto* pointee = target(cast(p));

        if (pointee == nullptr)
        {
            o << "<nil>";
            return;
        }

        if constexpr (! kIsOptional)
            o << "&";

        typeOf<Pointee>().print(o, pointee);
    }
};

//-----------------------------------------------------------------------------
// Functions and channels
//-----------------------------------------------------------------------------

template <typename T>
class FunctionMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;

public:
    Kind kind() const override                  { return Kind::function; }
    bool isNil(void const* p) const override    { return ! static_cast<bool>(cast(p)); }
    bool isZero(void const* p) const override   { return isNil(p); }

    // functions are only equal if both are nil
    bool equal(void const* a, void const* b) const override { return isNil(a) && isNil(b); }

    void print(std::ostream& o, void const* p) const override { o << (isNil(p) ? "<nil>" : "<func>"); }
};

template <typename T>
class ChannelMeta : public MetaTypeBase<T>
{
    using MetaTypeBase<T>::cast;
    using Element = std::remove_cvref_t<decltype(*std::declval<T&>().tryReceive())>;

public:
    Kind kind() const override                          { return Kind::channel; }
    MetaType const* elementMetaType() const override    { return &typeOf<Element>(); }
    bool isNil(void const* p) const override            { return cast(p).isNil(); }
    bool isZero(void const* p) const override           { return isNil(p); }
    bool equal(void const* a, void const* b) const override { return cast(a) == cast(b); }
    std::size_t length(void const* p) const override    { return cast(p).size(); }
    std::size_t capacity(void const* p) const override  { return cast(p).capacity(); }

    void print(std::ostream& o, void const* p) const override
    {
        if (isNil(p))
            o << "<nil>";
        else
            o << "<chan " << typeName<Element>() << " " << cast(p).size() << "/" << cast(p).capacity() << ">";
    }
};

//-----------------------------------------------------------------------------
// Selecting the MetaType implementation for a type
//-----------------------------------------------------------------------------

template <typename T>
struct MetaTypeSelector { using type = ScalarMeta<T>; };

template <typename T> requires kIsRecord<T>
struct MetaTypeSelector<T> { using type = RecordMeta<T>; };

template <typename E, typename A>
struct MetaTypeSelector<std::vector<E, A>> { using type = SequenceMeta<std::vector<E, A>>; };

// std::vector<bool> elements are not addressable
template <typename A>
struct MetaTypeSelector<std::vector<bool, A>> { using type = ScalarMeta<std::vector<bool, A>>; };

template <typename E, std::size_t N>
struct MetaTypeSelector<std::array<E, N>> { using type = ArrayMeta<std::array<E, N>>; };

template <typename K, typename V, typename C, typename A>
struct MetaTypeSelector<std::map<K, V, C, A>> { using type = MapMeta<std::map<K, V, C, A>>; };

template <typename E> requires (! std::is_function_v<E>)
struct MetaTypeSelector<E*> { using type = PointerMeta<E*>; };

template <typename E> requires std::is_function_v<E>
struct MetaTypeSelector<E*> { using type = FunctionMeta<E*>; };

template <typename E>
struct MetaTypeSelector<std::shared_ptr<E>> { using type = PointerMeta<std::shared_ptr<E>>; };

template <typename E>
struct MetaTypeSelector<std::optional<E>> { using type = PointerMeta<std::optional<E>>; };

template <typename S>
struct MetaTypeSelector<std::function<S>> { using type = FunctionMeta<std::function<S>>; };

template <typename E>
struct MetaTypeSelector<Channel<E>> { using type = ChannelMeta<Channel<E>>; };
} // namespace detail

template <typename T>
MetaType const& typeOf()
{
    if constexpr (! std::is_same_v<T, std::remove_cv_t<T>>)
        return typeOf<std::remove_cv_t<T>>();
    else
    {
        static typename detail::MetaTypeSelector<T>::type const instance;
        return instance;
    }
}

//=============================================================================
// Channel implementations
//=============================================================================
template <typename T>
Channel<T> Channel<T>::make(std::size_t capacity)
{
    Channel<T> result;
    result.state = std::make_shared<State>();
    result.state->capacity = capacity;
    return result;
}

template <typename T>
bool Channel<T>::trySend(T value)
{
    if (state == nullptr)
        return false;

    std::lock_guard guard(state->lock);

    if (state->buffer.size() >= state->capacity)
        return false;

    state->buffer.push_back(std::move(value));
    return true;
}

template <typename T>
std::optional<T> Channel<T>::tryReceive()
{
    if (state == nullptr)
        return {};

    std::lock_guard guard(state->lock);

    if (state->buffer.empty())
        return {};

    auto value = std::move(state->buffer.front());
    state->buffer.pop_front();
    return value;
}

template <typename T>
std::size_t Channel<T>::size() const
{
    if (state == nullptr)
        return 0;

    std::lock_guard guard(state->lock);
    return state->buffer.size();
}

template <typename T>
std::size_t Channel<T>::capacity() const
{
    return state != nullptr ? state->capacity : 0;
}

//=============================================================================
// Any implementations
//=============================================================================
template <typename T>
    requires (! std::is_same_v<std::decay_t<T>, Any> && ! std::is_same_v<std::decay_t<T>, Value>
           && ! std::is_same_v<std::decay_t<T>, std::nullptr_t>)
Any::Any(T&& value)
{
    using Type = std::decay_t<T>;

    if constexpr (std::is_same_v<Type, char const*> || std::is_same_v<Type, char*>)
    {
        if (value != nullptr)
        {
            meta = &typeOf<std::string>();
            storage = std::make_shared<std::string>(value);
        }
    }
    else if constexpr (std::is_same_v<Type, std::string_view>)
    {
        meta = &typeOf<std::string>();
        storage = std::make_shared<std::string>(value);
    }
    else
    {
        meta = &typeOf<Type>();
        storage = std::make_shared<Type>(std::forward<T>(value));
    }
}

template <typename T>
T const* Any::get() const
{
    return hasValue() && meta->typeInfo() == typeid(T) ? static_cast<T const*>(storage.get()) : nullptr;
}

template <typename T>
T* Any::get()
{
    return hasValue() && meta->typeInfo() == typeid(T) ? static_cast<T*>(storage.get()) : nullptr;
}

//=============================================================================
// Value implementations
//=============================================================================
template <typename T>
Value reflect(T&& value)
{
    using Type = std::decay_t<T>;

    if constexpr (std::is_same_v<Type, Value>)
        return value;
    else if constexpr (std::is_same_v<Type, std::nullptr_t>)
        return Value::kInvalid;
    else if constexpr (std::is_same_v<Type, Any>)
    {
        return Value::fromAny(value);
    }
    else if constexpr (std::is_same_v<Type, char const*> || std::is_same_v<Type, char*>)
        return value != nullptr ? reflect(std::string(value)) : Value::kInvalid;
    else if constexpr (std::is_same_v<Type, std::string_view>)
        return reflect(std::string(value));
    else
    {
        auto storage = std::make_shared<Type>(std::forward<T>(value));
        return Value::fromStorage(typeOf<Type>(), storage.get(), storage, false);
    }
}

template <typename T>
T const* Value::get() const
{
    return isValid() && meta->typeInfo() == typeid(T) ? static_cast<T const*>(data) : nullptr;
}

template <typename Lambda>
auto Value::visit(Lambda && lambda) const
{
    using AllArgumentRefs = detail::transform_tuple<SupportedFundamentalTypes, detail::add_const_lvalue_ref>::type;
    using SupportedArgumentsByLambda = decltype(detail::filter_tuple<detail::DoesLambdaSupportType<Lambda>::template Predicate>(std::declval<AllArgumentRefs>()));
    static_assert(std::tuple_size_v<SupportedArgumentsByLambda> >= 1, "Your lambda must be callable with at least one of the types in SupportedFundamentalTypes");

    using LambdaReturnTypes = detail::transform_tuple<SupportedArgumentsByLambda, detail::BindFirst<std::invoke_result_t, Lambda>::template Result>::type;
    using LambdaReturnType = detail::apply_tuple<std::common_type, LambdaReturnTypes>::type::type;

    static constexpr auto kReturnsVoid = std::is_void_v<LambdaReturnType>;
    using ReturnType = std::conditional_t<kReturnsVoid, bool, std::optional<std::conditional_t<kReturnsVoid, int, LambdaReturnType>>>;

    ReturnType result{};

    if (! isValid())
        return result;

    [this, &lambda, &result] <typename... Refs> (std::type_identity<std::tuple<Refs...>>)
    {
        ([this, &lambda, &result]
        {
            using Type = std::remove_cvref_t<Refs>;

            if (result || meta->typeInfo() != typeid(Type))
                return;

            if constexpr (kReturnsVoid)
            {
                lambda(*static_cast<Type const*>(data));
                result = true;
            }
            else
                result = lambda(*static_cast<Type const*>(data));
        }(), ...);
    }(std::type_identity<SupportedArgumentsByLambda>());

    return result;
}

template <typename T>
bool Value::equals(T&& other) const
{
    auto const rhs = reflect(std::forward<T>(other));

    if (! isValid() || ! rhs.isValid())
        return isValid() == rhs.isValid();

    return *meta == rhs.metaType() && meta->equal(data, rhs.data);
}

template <typename T>
Result<void> Value::setValue(T&& raw, bool allowConversion)
{
    return set(reflect(std::forward<T>(raw)), allowConversion);
}

template <typename T>
Result<Value> Value::convertTo(T&& sample) const
{
    return reflector::convertTo(*this, reflect(std::forward<T>(sample)));
}

template <typename T>
Result<T> Value::to() const
{
    auto converted = convertToType(typeOf<T>());

    if (! converted)
        return std::unexpected(std::move(converted.error()));

    auto const* result = converted->template get<T>();

    if (result == nullptr)
        return fail(ErrorKind::unconvertible, std::format("cannot convert {} to {}", metaType().name(), typeOf<T>().name()));

    return *result;
}

template <typename T>
Value Value::mustConvertTo(T&& sample) const
{
    auto converted = convertTo(std::forward<T>(sample));

    if (! converted)
    {
        logger()->error("mustConvertTo failed: {}", converted.error().message());
        throw Exception(std::move(converted.error()));
    }

    return *converted;
}

template <typename T>
Result<bool> Value::compareTo(T&& other, std::string_view op) const
{
    auto comparison = compare(*this, reflect(std::forward<T>(other)), op);

    if (! comparison)
        return std::unexpected(std::move(comparison.error()));

    return comparison->result;
}

template <typename T>
bool Value::mustCompareTo(T&& other, std::string_view op) const
{
    auto comparison = compareTo(std::forward<T>(other), op);

    if (! comparison)
    {
        logger()->error("mustCompareTo failed: {}", comparison.error().message());
        throw Exception(std::move(comparison.error()));
    }

    return *comparison;
}

//=============================================================================
// SequenceView implementations
//=============================================================================
template <typename E>
Result<std::vector<E>> SequenceView::convertTo() const
{
    auto converted = convertToType(typeOf<std::vector<E>>());

    if (! converted)
        return std::unexpected(std::move(converted.error()));

    return *converted->template get<std::vector<E>>();
}

} // namespace reflector
