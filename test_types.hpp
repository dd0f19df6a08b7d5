#pragma once

#include "reflector.hpp"

//=============================================================================
// Record types shared by the test translation units
//=============================================================================

struct Point {
    reflector::Field<float, "x"> x;
    reflector::Field<float, "y"> y;
};

struct Line {
    reflector::Field<Point, "start"> start;
    reflector::Field<Point, "finish"> finish;
};

struct Person {
    reflector::Field<std::string, "name"> name;
    reflector::Field<int32_t, "age"> age;
    reflector::Field<double, "score"> score;
    reflector::Field<bool, "active"> active;
};

struct Document {
    reflector::Field<std::string, "title"> title;
    reflector::Field<reflector::Timestamp, "created"> created;
    reflector::Field<std::vector<std::string>, "tags"> tags;
    reflector::Field<std::shared_ptr<Person>, "author"> author;
    reflector::Field<Point, "anchor"> anchor;
    reflector::Field<reflector::Any, "extra"> extra;
};

struct Counter {
    reflector::Field<int64_t, "hits"> hits;
    reflector::Field<std::optional<std::string>, "note"> note;
    reflector::Field<std::map<std::string, int32_t>, "buckets"> buckets;
};

struct Audit {
    reflector::Field<std::string, "owner"> owner;
    reflector::Field<int64_t, "revision"> revision;
    reflector::Field<std::string, "title"> title;
};

/// Embeds Audit, whose title is shadowed by the outer one
struct Report {
    reflector::Field<Audit, ""> audit;
    reflector::Field<std::string, "title"> title;
};

/// A type with a canonical "render as text" member
struct Version {
    int major = 0;
    int minor = 0;

    std::string toString() const { return std::to_string(major) + "." + std::to_string(minor); }

    friend bool operator==(Version const&, Version const&) = default;
};

enum class Color : uint8_t { red, green, blue };
