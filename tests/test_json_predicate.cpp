#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "predicate/json_predicate.hpp"

using nlohmann::json;

class JsonPredicateTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testAndOfEqualsAndRange();
    void testOrAndEmptyComposites();
    void testDoubleNegation();
    void testNotAcceptsArrayForm();
    void testScopeAndKeyResolution();
    void testPresence();
    void testEqualityIsTypeStrict();
    void testIgnoreCase();
    void testNumberRangeBounds();
    void testVersionMatcher();
    void testArrayContains();
    void testMalformedPredicatesFailClosed();
    void testToJsonRoundTrip();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

namespace {

json statusActiveAndScoreAtLeast10()
{
    return json{{"and", json::array({
        json{{"key", "status"}, {"value", {{"equals", "active"}}}},
        json{{"key", "score"}, {"value", {{"at_least", 10}}}}
    })}};
}

} // namespace

void JsonPredicateTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void JsonPredicateTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void JsonPredicateTests::testAndOfEqualsAndRange()
{
    const json predicate = statusActiveAndScoreAtLeast10();

    QVERIFY(!engage::evaluatePredicateJson(predicate, json{{"status", "active"}, {"score", 5}}));
    QVERIFY(engage::evaluatePredicateJson(predicate, json{{"status", "active"}, {"score", 15}}));
    QVERIFY(!engage::evaluatePredicateJson(predicate, json{{"status", "inactive"}, {"score", 15}}));
}

void JsonPredicateTests::testOrAndEmptyComposites()
{
    const json either = {{"or", json::array({
        json{{"key", "a"}, {"value", {{"equals", 1}}}},
        json{{"key", "b"}, {"value", {{"equals", 2}}}}
    })}};
    QVERIFY(engage::evaluatePredicateJson(either, json{{"b", 2}}));
    QVERIFY(!engage::evaluatePredicateJson(either, json{{"a", 2}, {"b", 1}}));

    QVERIFY(engage::evaluatePredicateJson(json{{"and", json::array()}}, json::object()));
    QVERIFY(!engage::evaluatePredicateJson(json{{"or", json::array()}}, json::object()));
}

void JsonPredicateTests::testDoubleNegation()
{
    const json inner = statusActiveAndScoreAtLeast10();
    const json doubled = {{"not", {{"not", inner}}}};

    const std::vector<json> subjects = {
        json{{"status", "active"}, {"score", 5}},
        json{{"status", "active"}, {"score", 15}},
        json{{"score", 99}},
        json("active"),
        json(),
        json::array({1, 2})
    };
    for (const auto &subject : subjects) {
        QCOMPARE(engage::evaluatePredicateJson(doubled, subject),
                 engage::evaluatePredicateJson(inner, subject));
    }
}

void JsonPredicateTests::testNotAcceptsArrayForm()
{
    const json notArray = {{"not", json::array({json{{"key", "a"}, {"value", {{"equals", 1}}}}})}};
    QVERIFY(engage::evaluatePredicateJson(notArray, json{{"a", 2}}));
    QVERIFY(!engage::evaluatePredicateJson(notArray, json{{"a", 1}}));

    const json twoChildren = {{"not", json::array({
        json{{"key", "a"}, {"value", {{"equals", 1}}}},
        json{{"key", "b"}, {"value", {{"equals", 1}}}}
    })}};
    QVERIFY(!engage::JsonPredicate::fromJson(twoChildren).has_value());
}

void JsonPredicateTests::testScopeAndKeyResolution()
{
    const json subject = {{"user", {{"profile", {{"tier", "gold"}}}}}};

    const json scoped = {{"scope", json::array({"user", "profile"})},
                         {"key", "tier"},
                         {"value", {{"equals", "gold"}}}};
    QVERIFY(engage::evaluatePredicateJson(scoped, subject));

    const json scopeString = {{"scope", "user"},
                              {"key", "profile.tier"},
                              {"value", {{"equals", "gold"}}}};
    QVERIFY(engage::evaluatePredicateJson(scopeString, subject));

    // Pathing through a non-object is "absent".
    const json throughString = {{"key", "user.profile.tier.extra"},
                                {"value", {{"is_present", false}}}};
    QVERIFY(engage::evaluatePredicateJson(throughString, subject));

    // No key and no scope matches the subject itself.
    QVERIFY(engage::evaluatePredicateJson(json{{"value", {{"equals", 3}}}}, json(3)));
}

void JsonPredicateTests::testPresence()
{
    const json present = {{"key", "a"}, {"value", {{"is_present", true}}}};
    const json absent = {{"key", "a"}, {"value", {{"is_present", false}}}};

    QVERIFY(engage::evaluatePredicateJson(present, json{{"a", 0}}));
    QVERIFY(engage::evaluatePredicateJson(present, json{{"a", nullptr}}));
    QVERIFY(!engage::evaluatePredicateJson(present, json{{"b", 1}}));
    QVERIFY(engage::evaluatePredicateJson(absent, json{{"b", 1}}));
    QVERIFY(!engage::evaluatePredicateJson(absent, json{{"a", nullptr}}));

    // Absent values only match is_present:false.
    const json equalsNull = {{"key", "a"}, {"value", {{"equals", nullptr}}}};
    QVERIFY(!engage::evaluatePredicateJson(equalsNull, json::object()));
    QVERIFY(engage::evaluatePredicateJson(equalsNull, json{{"a", nullptr}}));
}

void JsonPredicateTests::testEqualityIsTypeStrict()
{
    const json equalsOne = {{"key", "v"}, {"value", {{"equals", 1}}}};
    QVERIFY(engage::evaluatePredicateJson(equalsOne, json{{"v", 1}}));
    QVERIFY(engage::evaluatePredicateJson(equalsOne, json{{"v", 1.0}}));
    QVERIFY(!engage::evaluatePredicateJson(equalsOne, json{{"v", "1"}}));
    QVERIFY(!engage::evaluatePredicateJson(equalsOne, json{{"v", true}}));

    const json equalsTrue = {{"key", "v"}, {"value", {{"equals", true}}}};
    QVERIFY(engage::evaluatePredicateJson(equalsTrue, json{{"v", true}}));
    QVERIFY(!engage::evaluatePredicateJson(equalsTrue, json{{"v", 1}}));

    const json equalsObject = {{"key", "v"}, {"value", {{"equals", {{"a", json::array({1, "x"})}}}}}};
    QVERIFY(engage::evaluatePredicateJson(equalsObject, json{{"v", {{"a", json::array({1, "x"})}}}}));
    QVERIFY(!engage::evaluatePredicateJson(equalsObject, json{{"v", {{"a", json::array({"x", 1})}}}}));
}

void JsonPredicateTests::testIgnoreCase()
{
    const json sensitive = {{"key", "name"}, {"value", {{"equals", "Alice"}}}};
    const json insensitive = {{"key", "name"},
                              {"ignore_case", true},
                              {"value", {{"equals", "Alice"}}}};
    QVERIFY(!engage::evaluatePredicateJson(sensitive, json{{"name", "ALICE"}}));
    QVERIFY(engage::evaluatePredicateJson(insensitive, json{{"name", "ALICE"}}));

    const json nested = {{"key", "tags"},
                         {"ignore_case", true},
                         {"value", {{"equals", json::array({"VIP", "Gold"})}}}};
    QVERIFY(engage::evaluatePredicateJson(nested, json{{"tags", json::array({"vip", "GOLD"})}}));
}

void JsonPredicateTests::testNumberRangeBounds()
{
    const json range = {{"key", "n"}, {"value", {{"at_least", 1}, {"at_most", 2.5}}}};
    QVERIFY(engage::evaluatePredicateJson(range, json{{"n", 1}}));
    QVERIFY(engage::evaluatePredicateJson(range, json{{"n", 2.5}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"n", 2.6}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"n", 0}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"n", "2"}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"n", true}}));

    const json atMost = {{"key", "n"}, {"value", {{"at_most", -1}}}};
    QVERIFY(engage::evaluatePredicateJson(atMost, json{{"n", -3}}));
    QVERIFY(!engage::evaluatePredicateJson(atMost, json{{"n", 0}}));
}

void JsonPredicateTests::testVersionMatcher()
{
    const json range = {{"key", "app_version"}, {"value", {{"version_matches", "[1.0,2.0)"}}}};
    QVERIFY(engage::evaluatePredicateJson(range, json{{"app_version", "1.4.2"}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"app_version", "2.0"}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"app_version", 1.5}}));
    QVERIFY(!engage::evaluatePredicateJson(range, json{{"app_version", "1.x"}}));

    const json alias = {{"key", "app_version"}, {"value", {{"version", "3.+"}}}};
    QVERIFY(engage::evaluatePredicateJson(alias, json{{"app_version", "3.9.1"}}));
    QVERIFY(!engage::evaluatePredicateJson(alias, json{{"app_version", "4.0"}}));

    const json badConstraint = {{"key", "app_version"}, {"value", {{"version_matches", "[1.0"}}}};
    QVERIFY(!engage::JsonPredicate::fromJson(badConstraint).has_value());
}

void JsonPredicateTests::testArrayContains()
{
    const json contains = {{"key", "items"},
                           {"value", {{"array_contains", {{"value", {{"equals", "b"}}}}}}}};
    QVERIFY(engage::evaluatePredicateJson(contains, json{{"items", json::array({"a", "b"})}}));
    QVERIFY(!engage::evaluatePredicateJson(contains, json{{"items", json::array({"a", "c"})}}));
    QVERIFY(!engage::evaluatePredicateJson(contains, json{{"items", "b"}}));
    QVERIFY(!engage::evaluatePredicateJson(contains, json{{"items", json::array()}}));

    json indexed = contains;
    indexed["value"]["index"] = 1;
    QVERIFY(engage::evaluatePredicateJson(indexed, json{{"items", json::array({"a", "b"})}}));
    QVERIFY(!engage::evaluatePredicateJson(indexed, json{{"items", json::array({"b", "a"})}}));
    QVERIFY(!engage::evaluatePredicateJson(indexed, json{{"items", json::array({"b"})}}));

    indexed["value"]["index"] = -1;
    QVERIFY(!engage::evaluatePredicateJson(indexed, json{{"items", json::array({"b", "b"})}}));

    const json nestedObjects = {{"key", "purchases"},
                                {"value", {{"array_contains",
                                            {{"key", "sku"}, {"value", {{"equals", "X1"}}}}}}}};
    QVERIFY(engage::evaluatePredicateJson(
        nestedObjects,
        json{{"purchases", json::array({json{{"sku", "A"}}, json{{"sku", "X1"}}})}}));
}

void JsonPredicateTests::testMalformedPredicatesFailClosed()
{
    const std::vector<json> malformed = {
        json("not an object"),
        json::object(),
        json{{"and", "x"}},
        json{{"key", 5}, {"value", {{"equals", 1}}}},
        json{{"key", "a"}},
        json{{"key", "a"}, {"value", {{"unknown", 1}}}},
        json{{"key", "a"}, {"value", {{"at_least", "1"}}}},
        json{{"key", "a"}, {"value", {{"is_present", "yes"}}}},
        json{{"key", "a"}, {"ignore_case", "true"}, {"value", {{"equals", 1}}}},
        json{{"scope", json::array({1})}, {"value", {{"equals", 1}}}},
        json{{"key", "a"}, {"value", {{"array_contains", "x"}}}}
    };
    for (const auto &predicate : malformed) {
        QVERIFY(!engage::JsonPredicate::fromJson(predicate).has_value());
        QVERIFY(!engage::evaluatePredicateJson(predicate, json{{"a", 1}}));
    }
}

void JsonPredicateTests::testToJsonRoundTrip()
{
    const json source = {{"or", json::array({
        statusActiveAndScoreAtLeast10(),
        json{{"not", {{"scope", json::array({"device"})},
                      {"key", "os.version"},
                      {"ignore_case", false},
                      {"value", {{"version_matches", "]1.0,2.0["}}}}}},
        json{{"key", "items"}, {"value", {{"array_contains", {{"value", {{"is_present", true}}}}},
                                          {"index", 0}}}}
    })}};

    const auto parsed = engage::JsonPredicate::fromJson(source);
    QVERIFY(parsed.has_value());
    const json serialized = parsed->toJson();
    const auto reparsed = engage::JsonPredicate::fromJson(serialized);
    QVERIFY(reparsed.has_value());
    QVERIFY(reparsed->toJson() == serialized);

    const json subject = {{"status", "active"}, {"score", 11}};
    QCOMPARE(reparsed->evaluate(subject), parsed->evaluate(subject));
    QVERIFY(engage::matches(*parsed, subject));
}

QTEST_MAIN(JsonPredicateTests)
#include "test_json_predicate.moc"
