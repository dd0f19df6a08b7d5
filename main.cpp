#include <iostream>
#include <memory>
#include "reflector.hpp"

// Example usage
using namespace reflector;

struct Point
{
    Field<float, "x">      x;
    Field<float, "y">      y;
};

struct Line
{
    Field<Point, "start">       start;
    Field<Point, "finish">      finish;
};

struct Task
{
    Field<std::string,              "title"  > title;
    Field<int32_t,                  "priority"> priority;
    Field<Timestamp,                "due"    > due;
    Field<std::vector<std::string>, "labels" > labels;
    Field<std::shared_ptr<Line>,    "route"  > route;
    Field<Any,                      "note"   > note;
};

struct Application
{
    void run()
    {
        std::vector<Task> tasks(3);

        auto view = reflect(&tasks).mustSequence();

        // populate the records from untyped input
        std::vector<std::map<std::string, Any>> const rows {
            { { "title", Any("write docs") }, { "priority", Any("2") }, { "due", Any("2024-03-01T09:00:00+01:00") } },
            { { "title", Any("fix parser") }, { "priority", Any(5) },   { "labels", Any(std::vector<std::string> { "bug" }) } },
            { { "title", Any("release") },    { "priority", Any(3.0) }, { "route", Any(std::map<std::string, Any> { { "start", Any(std::map<std::string, Any> { { "x", Any(1.5f) } }) } }) } }
        };

        for (std::size_t i = 0; i < rows.size(); ++i)
        {
            auto record = view.index(i).mustStruct();

            if (auto result = record.fromMap(rows[i], true); ! result)
                std::cout << "row " << i << " rejected: " << result.error() << std::endl;
        }

        tasks[2].note = Any(std::string("ship it"));

        if (auto result = view.sortByField("priority", false); ! result)
            std::cout << "sorting failed: " << result.error() << std::endl;

        for (auto const& task : tasks)
            std::cout << reflect(task) << std::endl;

        auto const urgent = view.filterBy([] (Value const& task)
        {
            return task.field("priority").compareTo("3", ">=");
        });

        if (urgent)
            std::cout << urgent->length() << " tasks with priority >= 3" << std::endl;

        auto const& first = tasks.front();
        std::cout << std::format("{} is due {}", first.title(), reflect(first.due())) << std::endl;

        for (auto const& [name, value] : reflect(first).mustStruct().toMap(true, true))
            std::cout << "  " << name << ": " << value << std::endl;
    }
};

void conversionExamples()
{
    std::cout << "\n=== Conversion Examples ===\n\n";

    for (auto text : { "22", "yes", "2012-05-23T18:30:00.000-05:00", "many" })
    {
        auto const number = reflect(text).to<int>();
        auto const flag = reflect(text).to<bool>();
        auto const instant = reflect(text).to<Timestamp>();

        std::cout << "  \"" << text << "\"";
        std::cout << " int: " << (number ? std::to_string(*number) : number.error().message());
        std::cout << ", bool: " << (flag ? (*flag ? "true" : "false") : flag.error().message());
        std::cout << ", time: " << (instant ? formatTimestamp(*instant) : instant.error().message()) << "\n";
    }

    std::cout << "\n--- Comparisons ---\n";
    std::cout << "  10 < 20: " << reflect(10).mustCompareTo(20, "<") << "\n";
    std::cout << "  30u >= 20.0: " << reflect(30u).mustCompareTo(20.0, ">=") << "\n";
    std::cout << "  \"hello world\" like \"wor\": " << reflect("hello world").mustCompareTo("wor", "like") << "\n";

    if (auto const invalid = reflect(std::vector<int> { 1 }).compareTo(22, "="); ! invalid)
        std::cout << "  [1] = 22: " << invalid.error() << "\n";
}

void metaTypeExamples()
{
    std::cout << "\n=== MetaType Examples ===\n\n";

    auto const& taskMeta = typeOf<Task>();
    std::cout << "--- " << taskMeta.name() << " fields (no instance needed) ---\n";

    for (auto const& field : taskMeta.fields())
    {
        auto const& fieldMeta = field.metaType();
        std::cout << "  " << field.fieldname << " [" << toString(fieldMeta.kind());

        if (fieldMeta.elementMetaType() != nullptr)
            std::cout << " of " << toString(fieldMeta.elementMetaType()->kind());

        std::cout << "]\n";
    }

    auto instance = Value::create(taskMeta);
    if (auto result = instance.mustStruct().setFieldValue("title", std::string("constructed")); ! result)
        std::cout << "\n  Cannot set title: " << result.error() << "\n";

    std::cout << "\n  Constructed: " << instance << "\n";
}

int main()
{
    Application app;
    app.run();

    conversionExamples();
    metaTypeExamples();

    return 0;
}
