#include "reflector.hpp"

namespace reflector
{

Result<StructView> StructView::of(Value const& value)
{
    if (! value.isValid())
        return fail(ErrorKind::invalidValue, "cannot view an absent value as a record");

    auto target = value;

    if (target.isDynamic() || target.isRecordPointer())
    {
        target = target.dereference();

        if (! target.isValid())
            return fail(ErrorKind::invalidValue, std::format("cannot view a nil {} as a record", value.metaType().name()));
    }

    if (! target.isRecord())
        return fail(ErrorKind::notARecord, std::format("{} is not a record", target.metaType().name()));

    return StructView(std::move(target));
}

Result<StructView> StructView::makeNew() const
{
    auto fresh = Value::create(metaType());

    if (! fresh.isValid())
        return fail(ErrorKind::invalidValue, std::format("{} is not default constructible", metaType().name()));

    return StructView(std::move(fresh));
}

Value StructView::field(std::string_view name) const
{
    return record.field(name);
}

bool StructView::hasField(std::string_view name) const
{
    return field(name).isValid();
}

std::vector<std::pair<std::string_view, Value>> StructView::fields() const
{
    std::vector<std::pair<std::string_view, Value>> result;

    for (auto const& fld : metaType().fields())
        result.emplace_back(fld.fieldname, record.field(fld.fieldname));

    return result;
}

Result<Value> StructView::fieldValue(std::string_view name) const
{
    auto value = field(name);

    if (! value.isValid())
        return fail(ErrorKind::unknownField, std::string(name));

    return value;
}

Result<void> StructView::setField(std::string_view name, Value const& newValue, bool allowConversion)
{
    auto target = fieldValue(name);

    if (! target)
        return std::unexpected(std::move(target.error()));

    return target->set(newValue, allowConversion);
}

std::map<std::string, Any> StructView::toMap(bool omitZero, bool omitEmpty) const
{
    std::map<std::string, Any> data;

    for (auto const& [name, value] : fields())
    {
        auto const embedded = name.empty() && value.isRecord();

        if (embedded || ((value.isRecord() || value.isRecordPointer()) && ! value.isZero()))
        {
            if (auto nested = value.toStruct())
            {
                auto nestedData = nested->toMap(omitZero, omitEmpty);

                // fields declared by the outer record take precedence over embedded ones
                if (embedded)
                    data.merge(nestedData);
                else
                    data.insert_or_assign(std::string(name), Any(std::move(nestedData)));

                continue;
            }
        }

        if (omitEmpty && value.isEmpty())
            continue;

        if (value.isZero())
        {
            if (! omitZero)
                data.insert_or_assign(std::string(name), Any());

            continue;
        }

        data.insert_or_assign(std::string(name), value.toAny());
    }

    return data;
}

namespace
{
Error inField(std::string_view name, Error const& e)
{
    return Error { .kind = e.kind, .detail = std::format("field {}: {}", name, e.detail.empty() ? std::string(toString(e.kind)) : e.detail) };
}

/// A record field to populate from a nested map. Nil record pointers get a fresh pointee first.
Result<StructView> nestedRecord(Value& fld)
{
    if (fld.isRecordPointer() && fld.isNil())
    {
        if (auto allocated = fld.set(Value::create(*fld.metaType().elementMetaType()), true); ! allocated)
            return std::unexpected(std::move(allocated.error()));
    }

    return fld.toStruct();
}
} // namespace

Result<void> StructView::fromMap(std::map<std::string, Any> const& data, bool allowConversion)
{
    for (auto const& [key, raw] : data)
    {
        auto fld = field(key);

        if (! fld.isValid())
            continue;

        auto const value = reflect(raw);

        if (! value.isValid() || value.isZero())
            continue;

        if (auto const* nested = raw.get<std::map<std::string, Any>>(); nested != nullptr && (fld.isRecord() || fld.isRecordPointer()))
        {
            auto view = nestedRecord(fld);

            if (! view)
                return std::unexpected(inField(key, view.error()));

            if (auto result = view->fromMap(*nested, allowConversion); ! result)
                return std::unexpected(inField(key, result.error()));

            continue;
        }

        if (auto result = fld.set(value, allowConversion); ! result)
            return std::unexpected(inField(key, result.error()));
    }

    return {};
}

} // namespace reflector
