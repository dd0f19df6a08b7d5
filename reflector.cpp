#include "reflector.hpp"
#include <algorithm>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace reflector
{
//=============================================================================
// Kind and error implementations
//=============================================================================

std::string_view toString(Kind kind)
{
    switch (kind)
    {
        case Kind::invalid:  return "invalid";
        case Kind::boolean:  return "bool";
        case Kind::int8:     return "int8";
        case Kind::int16:    return "int16";
        case Kind::int32:    return "int32";
        case Kind::int64:    return "int64";
        case Kind::uint8:    return "uint8";
        case Kind::uint16:   return "uint16";
        case Kind::uint32:   return "uint32";
        case Kind::uint64:   return "uint64";
        case Kind::float32:  return "float32";
        case Kind::float64:  return "float64";
        case Kind::string:   return "string";
        case Kind::record:   return "record";
        case Kind::sequence: return "sequence";
        case Kind::array:    return "array";
        case Kind::map:      return "map";
        case Kind::pointer:  return "pointer";
        case Kind::dynamic:  return "dynamic";
        case Kind::function: return "function";
        case Kind::channel:  return "channel";
        case Kind::other:    return "other";
    }

    return "unknown";
}

std::string_view toString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::invalidValue:               return "invalid_value";
        case ErrorKind::typeMismatch:               return "type_mismatch";
        case ErrorKind::unconvertible:              return "unconvertible";
        case ErrorKind::invalidTime:                return "invalid_time";
        case ErrorKind::unsettable:                 return "unsettable";
        case ErrorKind::notARecord:                 return "not_a_record";
        case ErrorKind::notASequence:               return "not_a_sequence";
        case ErrorKind::unknownField:               return "unknown_field";
        case ErrorKind::unknownOperator:            return "unknown_operator";
        case ErrorKind::invalidComparison:          return "invalid_comparison";
        case ErrorKind::indexOutOfBounds:           return "index_out_of_bounds";
        case ErrorKind::cannotAppendToNonReference: return "cannot_append_to_non_reference";
    }

    return "unknown_error";
}

std::string Error::message() const
{
    if (detail.empty())
        return std::string(toString(kind));

    return std::format("{}: {}", toString(kind), detail);
}

std::unexpected<Error> fail(ErrorKind kind, std::string detail)
{
    return std::unexpected(Error { .kind = kind, .detail = std::move(detail) });
}

Exception::Exception(Error e) : std::runtime_error(e.message()), err(std::move(e)) {}

//=============================================================================
// MetaType implementations
//=============================================================================

FieldDescriptor const* MetaType::field(std::string_view fieldname) const
{
    auto const descriptors = fields();
    auto it = std::find_if(descriptors.begin(), descriptors.end(), [fieldname] (FieldDescriptor const& fld) { return fld.fieldname == fieldname; });
    return it != descriptors.end() ? &*it : nullptr;
}

bool operator==(MetaType const& a, MetaType const& b)
{
    return &a == &b || a.typeInfo() == b.typeInfo();
}

namespace
{
class InvalidMeta : public MetaType
{
public:
    std::type_info const& typeInfo() const override                  { return typeid(void); }
    Kind kind() const override                                       { return Kind::invalid; }
    std::string name() const override                                { return "invalid"; }
    std::shared_ptr<void> construct() const override                 { return nullptr; }
    std::shared_ptr<void> duplicate(void const*) const override      { return nullptr; }
    bool assign(void*, void const*) const override                   { return false; }
    bool equal(void const*, void const*) const override              { return true; }
    bool isZero(void const*) const override                          { return true; }
    bool isNil(void const*) const override                           { return true; }
    void print(std::ostream& o, void const*) const override          { o << "<invalid Value>"; }
};
} // namespace

MetaType const& invalidMetaType()
{
    static InvalidMeta const instance;
    return instance;
}

//=============================================================================
// Any implementations
//=============================================================================

class AnyMeta : public detail::MetaTypeBase<Any>
{
    using detail::MetaTypeBase<Any>::cast;

public:
    Kind kind() const override                  { return Kind::dynamic; }
    bool isNil(void const* p) const override    { return ! cast(p).hasValue(); }
    bool isZero(void const* p) const override   { return isNil(p); }

    bool equal(void const* a, void const* b) const override { return cast(a) == cast(b); }

    void print(std::ostream& o, void const* p) const override
    {
        auto const& content = cast(p);

        if (content.hasValue())
            content.meta->print(o, content.storage.get());
        else
            o << "<nil>";
    }

    Indirection indirect(void* p) const override
    {
        auto& content = cast(p);

        if (! content.hasValue())
            return {};

        return Indirection { .target = content.storage.get(), .type = content.meta, .access = Indirection::Access::readOnly };
    }

    bool box(void* dst, MetaType const& type, void const* src) const override
    {
        if (type == *this)
        {
            cast(dst) = cast(src);
            return true;
        }

        auto storage = type.duplicate(src);

        if (storage == nullptr)
            return false;

        cast(dst) = Any(type, std::move(storage));
        return true;
    }
};

template <>
MetaType const& typeOf<Any>()
{
    static AnyMeta const instance;
    return instance;
}

Any::Any(MetaType const& type, std::shared_ptr<void> content)
    : meta(content != nullptr ? &type : nullptr), storage(std::move(content))
{}

Any::Any(Any const& o)
    : meta(o.meta), storage(o.hasValue() ? o.meta->duplicate(o.storage.get()) : nullptr)
{
    if (storage == nullptr)
        meta = nullptr;
}

Any& Any::operator=(Any const& o)
{
    if (this != &o)
        *this = Any(o);

    return *this;
}

MetaType const& Any::metaType() const
{
    return meta != nullptr ? *meta : invalidMetaType();
}

bool operator==(Any const& a, Any const& b)
{
    if (! a.hasValue() || ! b.hasValue())
        return a.hasValue() == b.hasValue();

    return *a.meta == *b.meta && a.meta->equal(a.storage.get(), b.storage.get());
}

//=============================================================================
// Value implementations
//=============================================================================

Value const Value::kInvalid{};

Value::Value(MetaType const& type, void* data_, std::shared_ptr<void> owner_, bool addressable_)
    : meta(&type), data(data_), owner(std::move(owner_)), addressable(addressable_)
{}

Value Value::fromStorage(MetaType const& type, void* storage, std::shared_ptr<void> keepAlive, bool writable)
{
    if (storage == nullptr || type.kind() == Kind::invalid)
        return kInvalid;

    return Value(type, storage, std::move(keepAlive), writable);
}

Value Value::create(MetaType const& type)
{
    auto storage = type.construct();
    return fromStorage(type, storage.get(), storage, true);
}

Value Value::fromAny(Any const& box)
{
    if (! box.hasValue())
        return kInvalid;

    auto storage = box.meta->duplicate(box.storage.get());
    return fromStorage(*box.meta, storage.get(), storage, false);
}

Value Value::child(MetaType const& type, void* childData, bool childAddressable) const
{
    return fromStorage(type, childData, owner, childAddressable);
}

MetaType const& Value::metaType() const
{
    return meta != nullptr ? *meta : invalidMetaType();
}

bool Value::isRecordPointer() const
{
    return isPointer() && meta->elementMetaType()->kind() == Kind::record;
}

bool Value::isIterable() const
{
    switch (kind())
    {
        case Kind::array:
        case Kind::channel:
        case Kind::map:
        case Kind::sequence:
        case Kind::string:
            return true;
        default:
            return false;
    }
}

std::size_t Value::length() const
{
    if (isString())
        return get<std::string>()->size();

    return isIterable() ? meta->length(data) : 0;
}

bool Value::isNil() const
{
    switch (kind())
    {
        case Kind::invalid:
            return true;
        case Kind::pointer:
        case Kind::dynamic:
        case Kind::function:
        case Kind::channel:
            return meta->isNil(data);
        default:
            return false;
    }
}

bool Value::isZero() const
{
    if (isNil())
        return true;

    switch (kind())
    {
        case Kind::sequence:
        case Kind::array:
        case Kind::map:
            return false;
        default:
            return meta->isZero(data);
    }
}

bool Value::isDeepZero() const
{
    if (isZero())
        return true;

    if (isPointer() || isDynamic())
        return dereference().isDeepZero();

    return false;
}

bool Value::isEmpty() const
{
    if (isZero())
        return true;

    switch (kind())
    {
        case Kind::array:
        case Kind::channel:
        case Kind::map:
        case Kind::sequence:
            return length() < 1;
        default:
            return false;
    }
}

Value Value::dereference() const
{
    if (! isPointer() && ! isDynamic())
        return kInvalid;

    auto const target = meta->indirect(data);

    if (target.target == nullptr)
        return kInvalid;

    auto const writable = target.access == Indirection::Access::independent
                       || (target.access == Indirection::Access::embedded && addressable);

    return child(*target.type, target.target, writable);
}

Value Value::address() const
{
    if (! isValid() || ! addressable)
        return kInvalid;

    auto const* pointerType = meta->pointerMetaType();

    if (pointerType == nullptr)
        return kInvalid;

    auto storage = pointerType->pointerTo(std::shared_ptr<void>(owner, data));
    return fromStorage(*pointerType, storage.get(), storage, false);
}

Value Value::index(std::size_t i) const
{
    if (! isSequence() && ! isFixedArray())
        return kInvalid;

    return child(*meta->elementMetaType(), meta->index(data, i), isSequence() || addressable);
}

Value Value::field(std::string_view name) const
{
    if (! isRecord())
        return kInvalid;

    if (auto const* fld = meta->field(name))
        return child(fld->metaType(), fld->access(data), addressable);

    for (auto const& fld : meta->fields())
    {
        if (! fld.fieldname.empty() || fld.metaType().kind() != Kind::record)
            continue;

        if (auto promoted = child(fld.metaType(), fld.access(data), addressable).field(name); promoted.isValid())
            return promoted;
    }

    return kInvalid;
}

namespace
{
/// Brings a value into the given type: dynamic destinations box, others must match or be converted
Result<Value> coerce(Value const& value, MetaType const& type, bool allowConversion)
{
    if (! value.isValid())
        return fail(ErrorKind::invalidValue, "absent value");

    if (value.metaType() == type)
        return value;

    if (type.kind() == Kind::dynamic)
        return convertToType(value, type);

    if (! allowConversion)
        return fail(ErrorKind::typeMismatch, std::format("expected {} but got {}", type.name(), value.metaType().name()));

    return convertToType(value, type);
}
} // namespace

Value Value::mapIndex(Value const& key) const
{
    if (! isMap())
        return kInvalid;

    auto convertedKey = coerce(key, *meta->keyMetaType(), true);

    if (! convertedKey)
        return kInvalid;

    return child(*meta->elementMetaType(), meta->find(data, convertedKey->data), false);
}

Result<void> Value::setMapIndex(Value const& key, Value const& value, bool allowConversion)
{
    if (! isMap())
        return fail(ErrorKind::invalidValue, std::format("{} is not a map", metaType().name()));

    auto convertedKey = coerce(key, *meta->keyMetaType(), allowConversion);

    if (! convertedKey)
        return std::unexpected(std::move(convertedKey.error()));

    auto convertedValue = coerce(value, *meta->elementMetaType(), allowConversion);

    if (! convertedValue)
        return std::unexpected(std::move(convertedValue.error()));

    if (! meta->insert(data, convertedKey->data, convertedValue->data))
        return fail(ErrorKind::unsettable, std::format("{} values are not copy assignable", metaType().name()));

    return {};
}

Result<void> Value::set(Value const& newValue, bool allowConversion)
{
    if (! isValid())
        return fail(ErrorKind::invalidValue, "cannot set the absent value");

    if (! newValue.isValid())
        return fail(ErrorKind::invalidValue, "cannot set from an absent value");

    if (! addressable)
        return fail(ErrorKind::unsettable, std::format("{} value is not addressable", meta->name()));

    auto source = coerce(newValue, *meta, allowConversion);

    if (! source)
        return std::unexpected(std::move(source.error()));

    if (! meta->assign(data, source->data))
        return fail(ErrorKind::unsettable, std::format("{} is not copy assignable", meta->name()));

    return {};
}

void Value::mustSet(Value const& newValue, bool allowConversion)
{
    if (auto result = set(newValue, allowConversion); ! result)
    {
        logger()->error("mustSet failed: {}", result.error().message());
        throw Exception(std::move(result.error()));
    }
}

Result<Value> Value::convertToType(MetaType const& target) const
{
    return reflector::convertToType(*this, target);
}

Value Value::mustConvertToType(MetaType const& target) const
{
    auto converted = convertToType(target);

    if (! converted)
    {
        logger()->error("mustConvertToType failed: {}", converted.error().message());
        throw Exception(std::move(converted.error()));
    }

    return *converted;
}

Value Value::clone() const
{
    if (! isValid())
        return kInvalid;

    auto storage = meta->duplicate(data);
    return fromStorage(*meta, storage.get(), storage, false);
}

Any Value::toAny() const
{
    if (! isValid())
        return {};

    if (isDynamic())
        return *static_cast<Any const*>(data);

    return Any(*meta, meta->duplicate(data));
}

std::string Value::toString() const
{
    std::ostringstream ss;
    metaType().print(ss, data);
    return ss.str();
}

Result<StructView> Value::toStruct() const
{
    return StructView::of(*this);
}

Result<SequenceView> Value::toSequence() const
{
    return SequenceView::of(*this);
}

StructView Value::mustStruct() const
{
    auto view = toStruct();

    if (! view)
    {
        logger()->error("mustStruct failed: {}", view.error().message());
        throw Exception(std::move(view.error()));
    }

    return *view;
}

SequenceView Value::mustSequence() const
{
    auto view = toSequence();

    if (! view)
    {
        logger()->error("mustSequence failed: {}", view.error().message());
        throw Exception(std::move(view.error()));
    }

    return *view;
}

//=============================================================================
// Timestamp implementations
//=============================================================================
namespace
{
/// Reads exactly count decimal digits
std::optional<unsigned> readDigits(std::string_view text, std::size_t& pos, std::size_t count)
{
    if (pos + count > text.size())
        return {};

    unsigned value = 0;

    for (std::size_t i = 0; i < count; ++i)
    {
        auto const c = text[pos + i];

        if (c < '0' || c > '9')
            return {};

        value = value * 10 + static_cast<unsigned>(c - '0');
    }

    pos += count;
    return value;
}

bool readChar(std::string_view text, std::size_t& pos, char expected)
{
    if (pos >= text.size() || text[pos] != expected)
        return false;

    ++pos;
    return true;
}
} // namespace

Result<Timestamp> parseTimestamp(std::string_view text)
{
    using namespace std::chrono;

    auto const invalid = [text] { return fail(ErrorKind::invalidTime, std::format("\"{}\" is not an RFC 3339 timestamp", text)); };

    std::size_t pos = 0;
    auto const y = readDigits(text, pos, 4);
    if (! y || ! readChar(text, pos, '-')) return invalid();
    auto const mon = readDigits(text, pos, 2);
    if (! mon || ! readChar(text, pos, '-')) return invalid();
    auto const d = readDigits(text, pos, 2);
    if (! d || ! readChar(text, pos, 'T')) return invalid();
    auto const h = readDigits(text, pos, 2);
    if (! h || ! readChar(text, pos, ':')) return invalid();
    auto const min = readDigits(text, pos, 2);
    if (! min || ! readChar(text, pos, ':')) return invalid();
    auto const s = readDigits(text, pos, 2);
    if (! s) return invalid();

    std::int64_t fraction = 0;

    if (readChar(text, pos, '.'))
    {
        std::size_t digitCount = 0;

        for (; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos, ++digitCount)
            if (digitCount < 9)
                fraction = fraction * 10 + (text[pos] - '0');

        if (digitCount == 0)
            return invalid();

        for (; digitCount < 9; ++digitCount)
            fraction *= 10;
    }

    minutes offset{0};

    if (! readChar(text, pos, 'Z'))
    {
        if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-'))
            return invalid();

        auto const sign = text[pos++] == '-' ? -1 : 1;
        auto const offsetHours = readDigits(text, pos, 2);
        if (! offsetHours || ! readChar(text, pos, ':')) return invalid();
        auto const offsetMinutes = readDigits(text, pos, 2);
        if (! offsetMinutes || *offsetHours > 23 || *offsetMinutes > 59) return invalid();

        offset = sign * (hours(*offsetHours) + minutes(*offsetMinutes));
    }

    if (pos != text.size())
        return invalid();

    year_month_day const date { year(static_cast<int>(*y)), month(*mon), day(*d) };

    if (! date.ok() || *h > 23 || *min > 59 || *s > 59)
        return invalid();

    // the time of day and the offset add at most two days to midnight
    auto const midnight = sys_days(date);

    if (midnight < std::chrono::ceil<days>(Timestamp::min()) + days(2) || midnight > std::chrono::floor<days>(Timestamp::max()) - days(2))
        return fail(ErrorKind::invalidTime, std::format("\"{}\" is outside the range of nanosecond timestamps", text));

    return Timestamp(midnight) + hours(*h) + minutes(*min) + seconds(*s) + nanoseconds(fraction) - offset;
}

std::string formatTimestamp(Timestamp ts)
{
    using namespace std::chrono;

    auto const midnight = floor<days>(ts);
    year_month_day const date { midnight };
    hh_mm_ss const time { ts - midnight };

    auto result = std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                              static_cast<int>(date.year()), static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()),
                              time.hours().count(), time.minutes().count(), time.seconds().count());

    if (auto const nanos = time.subseconds().count(); nanos != 0)
    {
        auto fraction = std::format("{:09}", nanos);
        fraction.erase(fraction.find_last_not_of('0') + 1);
        result += "." + fraction;
    }

    return result + "Z";
}

//=============================================================================
// Logging
//=============================================================================

std::shared_ptr<spdlog::logger> logger()
{
    static auto const instance = std::invoke([]
    {
        auto result = spdlog::get("reflector");

        if (result == nullptr)
        {
            result = spdlog::stderr_color_mt("reflector");
            result->set_level(spdlog::level::warn);
        }

        return result;
    });

    return instance;
}

void setLogLevel(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

//=============================================================================
// Stream operators implementations
//=============================================================================

std::ostream& operator<<(std::ostream& o, Value const& x)
{
    return o << x.toString();
}

std::ostream& operator<<(std::ostream& o, Any const& x)
{
    typeOf<Any>().print(o, &x);
    return o;
}

std::ostream& operator<<(std::ostream& o, Error const& x)
{
    return o << x.message();
}

} // namespace reflector
