#include "reflector.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace reflector
{
namespace
{
//=============================================================================
// Text helpers
//=============================================================================

std::string_view trim(std::string_view text)
{
    auto const isSpace = [] (char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (! text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (! text.empty() && isSpace(text.back()))  text.remove_suffix(1);

    return text;
}

std::string toLower(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [] (unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<bool> parseBool(std::string_view text)
{
    auto const word = toLower(trim(text));

    if (word == "y" || word == "yes" || word == "1")
        return true;

    if (word == "n" || word == "no" || word == "0")
        return false;

    return {};
}

/// A 64-bit floating point literal, optionally signed. Out of range literals are rejected.
std::optional<double> parseFloat(std::string_view text)
{
    if (text.starts_with('+'))
    {
        text.remove_prefix(1);

        if (text.starts_with('-'))
            return {};
    }

    if (text.empty())
        return {};

    double value = 0.0;
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);

    if (ec != std::errc{} || ptr != text.data() + text.size())
        return {};

    return value;
}

//=============================================================================
// Conversion rules
//=============================================================================

/// Wraps freshly allocated storage as the result of a conversion
Value converted(MetaType const& type, std::shared_ptr<void> storage)
{
    return Value::fromStorage(type, storage.get(), storage, false);
}

Result<Value> copyOf(Value const& value)
{
    auto copy = value.clone();

    if (! copy.isValid())
        return fail(ErrorKind::unconvertible, std::format("{} is not copy constructible", value.metaType().name()));

    return copy;
}

Result<Value> convertSequence(Value const& value, MetaType const& target)
{
    auto const& element = *target.elementMetaType();
    auto storage = target.construct();

    if (storage == nullptr)
        return fail(ErrorKind::unconvertible, std::format("{} is not default constructible", target.name()));

    for (std::size_t i = 0; i < value.length(); ++i)
    {
        auto item = convertToType(value.index(i), element);

        if (! item)
            return fail(ErrorKind::typeMismatch, std::format("element {}: {}", i, item.error().message()));

        if (! target.append(storage.get(), item->unsafePointer()))
            return fail(ErrorKind::typeMismatch, std::format("element {}: {} is not copy constructible", i, element.name()));
    }

    return converted(target, std::move(storage));
}

/// A fresh pointee only outlives the conversion if the target pointer owns it
Result<Value> pointerTo(Value const& value, MetaType const& target)
{
    if (! target.ownsPointee())
        return fail(ErrorKind::unconvertible, std::format("cannot store a temporary {} in {}", value.metaType().name(), target.name()));

    auto pointee = value.metaType().duplicate(value.unsafePointer());

    if (pointee == nullptr)
        return fail(ErrorKind::unconvertible, std::format("{} is not copy constructible", value.metaType().name()));

    auto storage = target.pointerTo(std::move(pointee));

    if (storage == nullptr)
        return fail(ErrorKind::unconvertible, std::format("cannot point a {} at {}", target.name(), value.metaType().name()));

    return converted(target, std::move(storage));
}

Result<Value> pointee(Value const& value)
{
    auto target = value.dereference();

    if (! target.isValid())
        return fail(ErrorKind::invalidValue, std::format("cannot dereference a nil {}", value.metaType().name()));

    return copyOf(target);
}

Result<Value> timestamp(Value const& value, MetaType const& target)
{
    auto ts = parseTimestamp(*value.get<std::string>());

    if (! ts)
        return std::unexpected(std::move(ts.error()));

    auto parsed = reflect(*ts);
    return target.isTimestamp() ? parsed : pointerTo(parsed, target);
}

Value text(Value const& value)
{
    if (auto content = value.metaType().text(value.unsafePointer()))
        return reflect(std::move(*content));

    return reflect(value.toString());
}

Result<Value> number(Value const& value, MetaType const& target)
{
    auto const& literal = *value.get<std::string>();
    auto const parsed = parseFloat(literal);

    if (! parsed)
        return fail(ErrorKind::unconvertible, std::format("\"{}\" is not a number", literal));

    auto storage = target.construct();

    if (storage == nullptr || ! target.assignNumber(storage.get(), *parsed))
        return fail(ErrorKind::unconvertible, std::format("{} is out of range for {}", literal, target.name()));

    return converted(target, std::move(storage));
}

/// Numeric conversions, boxing and unboxing, text to bytes
Result<Value> builtin(Value const& value, MetaType const& target)
{
    auto const& source = value.metaType();

    if (target.kind() == Kind::dynamic)
    {
        auto storage = target.construct();

        if (storage != nullptr && target.box(storage.get(), source, value.unsafePointer()))
            return converted(target, std::move(storage));
    }
    else if (source.kind() == Kind::dynamic)
    {
        if (auto content = value.dereference(); content.isValid())
            return convertToType(content, target);
    }
    else if (isNumericKind(source.kind()) && isNumericKind(target.kind()))
    {
        auto storage = target.construct();
        auto const n = source.number(value.unsafePointer());

        if (storage != nullptr && n && target.assignNumber(storage.get(), *n))
            return converted(target, std::move(storage));

        return fail(ErrorKind::unconvertible, std::format("{} is out of range for {}", value.toString(), target.name()));
    }
    else if (source.kind() == Kind::string && target.isBytes())
    {
        auto storage = target.construct();

        if (storage != nullptr && target.assignText(storage.get(), *value.get<std::string>()))
            return converted(target, std::move(storage));
    }

    return fail(ErrorKind::unconvertible, std::format("cannot convert {} to {}", source.name(), target.name()));
}

Result<Value> generic(Value const& value, MetaType const& target)
{
    try
    {
        auto result = builtin(value, target);

        if (result && ! result->isValid())
            return fail(ErrorKind::unconvertible, std::format("converting {} to {} produced no value", value.metaType().name(), target.name()));

        return result;
    }
    catch (std::exception const& e)
    {
        SPDLOG_LOGGER_DEBUG(logger(), "conversion from {} to {} raised: {}", value.metaType().name(), target.name(), e.what());
        return fail(ErrorKind::unconvertible, e.what());
    }
}
} // namespace

//=============================================================================
// Conversion engine
//=============================================================================

Result<Value> convertToType(Value const& value, MetaType const& target)
{
    if (! value.isValid())
        return fail(ErrorKind::invalidValue, std::format("cannot convert an absent value to {}", target.name()));

    if (target.kind() == Kind::invalid)
        return fail(ErrorKind::invalidValue, "cannot convert to the invalid type");

    auto const& source = value.metaType();
    auto const* targetPointee = target.kind() == Kind::pointer ? target.elementMetaType() : nullptr;
    auto const* sourcePointee = source.kind() == Kind::pointer ? source.elementMetaType() : nullptr;

    if (source == target)
        return copyOf(value);

    if (source.kind() == Kind::sequence && target.kind() == Kind::sequence)
        return convertSequence(value, target);

    if (targetPointee != nullptr && *targetPointee == source)
        return pointerTo(value, target);

    if (sourcePointee != nullptr && *sourcePointee == target)
        return pointee(value);

    if (source.kind() == Kind::string && (target.isTimestamp() || (targetPointee != nullptr && targetPointee->isTimestamp())))
        return timestamp(value, target);

    if (source.kind() == Kind::string && target.kind() == Kind::boolean)
    {
        if (auto const parsed = parseBool(*value.get<std::string>()))
            return reflect(*parsed);
    }

    if (target.kind() == Kind::string)
        return text(value);

    if (source.kind() == Kind::string && isNumericKind(target.kind()))
        return number(value, target);

    return generic(value, target);
}

Result<Value> convertTo(Value const& value, Value const& sample)
{
    if (! sample.isValid())
        return fail(ErrorKind::invalidValue, "cannot convert to the type of an absent value");

    return convertToType(value, sample.metaType());
}

} // namespace reflector
