// tests/model/test_json_model.cpp
#define BOOST_TEST_MODULE JsonModelTests
#include <boost/test/unit_test.hpp>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "jsonmodel/jsonmodel.hpp"

namespace {

class TestModel1 : public jsonmodel::Model<TestModel1> {
public:
    JSONMODEL_PROPERTY(Field1, "Field1")
    JSONMODEL_PROPERTY(Field2, "Field2")
    JSONMODEL_FIELDS(TestModel1, Field1, Field2)
};

class NestedModel : public jsonmodel::Model<NestedModel> {
public:
    JSONMODEL_PROPERTY(Field1, "Field1")
    JSONMODEL_PROPERTY(Field2, "Field2")
    JSONMODEL_MODEL_PROPERTY(Field3, "Field3", TestModel1)
    JSONMODEL_FIELDS(NestedModel, Field1, Field2, Field3)
};

class ListModel : public jsonmodel::Model<ListModel> {
public:
    JSONMODEL_MODEL_LIST_PROPERTY(Field1, "Field1", TestModel1)
    JSONMODEL_FIELDS(ListModel, Field1)
};

class RenamedModel : public jsonmodel::Model<RenamedModel> {
public:
    JSONMODEL_PROPERTY(Field1, "Field1")
    JSONMODEL_PROPERTY(Field2, "field_2")
    JSONMODEL_FIELDS(RenamedModel, Field1, Field2)
};

}  // namespace

using jsonmodel::ConversionTypeMismatch;
using jsonmodel::InvalidInputType;
using jsonmodel::UnknownFieldError;
using nlohmann::json;

BOOST_AUTO_TEST_SUITE(ScalarFieldTests)

BOOST_AUTO_TEST_CASE(test_simple_get_set) {
    TestModel1 model;
    BOOST_CHECK(model.Field1().is_null());

    model.set_Field1(2);
    BOOST_CHECK_EQUAL(model.Field1(), json(2));
}

BOOST_AUTO_TEST_CASE(test_unset_fields_read_as_null) {
    TestModel1 model;
    BOOST_CHECK(model.Field1().is_null());
    BOOST_CHECK(model.Field2().is_null());
    BOOST_CHECK(!model.is_set("Field1"));
    BOOST_CHECK_EQUAL(model.set_field_count(), 0u);
}

BOOST_AUTO_TEST_CASE(test_simple_to_entity) {
    auto model = TestModel1::create({{"Field1", 2}});

    json obj = model.to_json_entity();
    BOOST_CHECK_EQUAL(obj["Field1"], json(2));
    BOOST_CHECK_MESSAGE(!obj.contains("Field2"),
                        "An unset value should not be present");

    model.set_Field2("a string!");

    obj = model.to_json_entity();
    BOOST_CHECK_MESSAGE(obj.contains("Field2"), "Now the string should be present");
    BOOST_CHECK_EQUAL(obj["Field2"].get<std::string>(), "a string!");
}

BOOST_AUTO_TEST_CASE(test_simple_from_entity) {
    auto model = TestModel1::from_json_entity({{"Field1", 2}});
    BOOST_CHECK_EQUAL(model.Field1(), json(2));
    BOOST_CHECK_MESSAGE(model.Field2().is_null(), "Field 2 should not have been set");

    model = TestModel1::from_json_entity({{"Field2", "is set"}, {"Field1", 3}});
    BOOST_CHECK_EQUAL(model.Field1(), json(3));
    BOOST_CHECK_EQUAL(model.Field2().get<std::string>(), "is set");
}

BOOST_AUTO_TEST_CASE(test_scalar_round_trip) {
    const std::vector<json> inputs = {
        json::object(),
        {{"Field1", 1}},
        {{"Field1", -2.5}, {"Field2", "text"}},
        {{"Field1", true}, {"Field2", nullptr}},
        {{"Field1", json::array({1, "two", 3.0})}},
        {{"Field2", {{"free", "form"}, {"nested", {1, 2}}}}},
    };

    for (const auto& input : inputs) {
        BOOST_CHECK_EQUAL(TestModel1::from_json_entity(input).to_json_entity(),
                          input);
    }
}

BOOST_AUTO_TEST_CASE(test_unset_field_is_omitted) {
    TestModel1 model;
    model.set_Field2(5);

    json obj = model.to_json_entity();
    BOOST_CHECK(!obj.contains("Field1"));
    BOOST_CHECK_EQUAL(obj, json({{"Field2", 5}}));
}

BOOST_AUTO_TEST_CASE(test_empty_model_serializes_to_empty_object) {
    json obj = TestModel1().to_json_entity();
    BOOST_CHECK(obj.is_object());
    BOOST_CHECK(obj.empty());
}

BOOST_AUTO_TEST_CASE(test_explicit_null_is_serialized) {
    TestModel1 model;
    model.set_Field1(nullptr);

    BOOST_CHECK(model.Field1().is_null());
    BOOST_CHECK(model.is_set("Field1"));

    json obj = model.to_json_entity();
    BOOST_REQUIRE(obj.contains("Field1"));
    BOOST_CHECK(obj["Field1"].is_null());
    BOOST_CHECK(!obj.contains("Field2"));
}

BOOST_AUTO_TEST_CASE(test_setter_getter_symmetry) {
    const std::vector<json> values = {
        json(0), json(42), json(-7.25), json(true), json(false), json("x"),
        json(nullptr), json::array({1, 2}), json({{"k", "v"}})};

    TestModel1 model;
    for (const auto& value : values) {
        model.set_Field1(value);
        BOOST_CHECK_EQUAL(model.Field1(), value);
        BOOST_CHECK_EQUAL(model.to_json_entity()["Field1"], value);
    }
}

BOOST_AUTO_TEST_CASE(test_independent_name_mapping) {
    RenamedModel model;
    model.set_Field2("renamed");

    json obj = model.to_json_entity();
    BOOST_CHECK(obj.contains("field_2"));
    BOOST_CHECK(!obj.contains("Field2"));

    auto parsed = RenamedModel::from_json_entity({{"field_2", 9}, {"Field2", 10}});
    BOOST_CHECK_EQUAL(parsed.Field2(), json(9));
    BOOST_CHECK(parsed.Field1().is_null());
}

BOOST_AUTO_TEST_CASE(test_ignore_unknowns) {
    auto model = TestModel1::from_json_entity({{"Field3", "unknown"}});
    BOOST_CHECK(model.Field1().is_null());
    BOOST_CHECK(model.Field2().is_null());
    BOOST_CHECK_EQUAL(model.set_field_count(), 0u);
    BOOST_CHECK(model.to_json_entity().empty());
}

BOOST_AUTO_TEST_CASE(test_unknown_keys_next_to_known_ones) {
    auto model = TestModel1::from_json_entity(
        {{"Field1", 1}, {"Other", {1, 2, 3}}, {"field1", "wrong case"}});
    BOOST_CHECK_EQUAL(model.Field1(), json(1));
    BOOST_CHECK_EQUAL(model.to_json_entity(), json({{"Field1", 1}}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NestedModelTests)

BOOST_AUTO_TEST_CASE(test_nested) {
    const std::string jsonstr = R"({
        "Field1": 2,
        "Field2": 5,
        "Field3": {
            "Field1": "field one",
            "Field2": "field two"
        }
    })";
    const json parsed = json::parse(jsonstr);

    auto model = NestedModel::from_json_entity(parsed);
    BOOST_CHECK_EQUAL(model.Field1(), json(2));
    BOOST_CHECK_EQUAL(model.Field2(), json(5));
    BOOST_REQUIRE(model.Field3() != nullptr);
    BOOST_CHECK_EQUAL(model.Field3()->Field2().get<std::string>(), "field two");

    BOOST_CHECK_EQUAL(model.to_json_entity(), parsed);
}

BOOST_AUTO_TEST_CASE(test_nested_unset_is_null_pointer) {
    NestedModel model;
    BOOST_CHECK(model.Field3() == nullptr);
    BOOST_CHECK(!model.to_json_entity().contains("Field3"));
}

BOOST_AUTO_TEST_CASE(test_nested_setter) {
    NestedModel model;
    model.set_Field3(TestModel1::create({{"Field1", "inner"}}));

    BOOST_REQUIRE(model.Field3() != nullptr);
    model.Field3()->set_Field2(7);

    BOOST_CHECK_EQUAL(model.to_json_entity(),
                      json({{"Field3", {{"Field1", "inner"}, {"Field2", 7}}}}));
}

BOOST_AUTO_TEST_CASE(test_nested_requires_object) {
    BOOST_CHECK_THROW(NestedModel::from_json_entity({{"Field3", "not an object"}}),
                      InvalidInputType);
    BOOST_CHECK_THROW(NestedModel::from_json_entity({{"Field3", nullptr}}),
                      InvalidInputType);
}

BOOST_AUTO_TEST_CASE(test_copy_is_deep) {
    auto original = NestedModel::from_json_entity(
        {{"Field1", 1}, {"Field3", {{"Field1", "a"}}}});

    NestedModel copy = original;
    copy.Field3()->set_Field1("b");

    BOOST_CHECK_EQUAL(original.Field3()->Field1().get<std::string>(), "a");
    BOOST_CHECK_EQUAL(copy.Field3()->Field1().get<std::string>(), "b");
    BOOST_CHECK(original.Field3() != copy.Field3());
}

BOOST_AUTO_TEST_CASE(test_clone_preserves_dynamic_type) {
    auto original = NestedModel::from_json_entity({{"Field3", {{"Field2", 3}}}});
    std::unique_ptr<jsonmodel::JsonModel> clone = original.clone();

    BOOST_CHECK(dynamic_cast<NestedModel*>(clone.get()) != nullptr);
    BOOST_CHECK_EQUAL(clone->model_name(), "NestedModel");
    BOOST_CHECK_EQUAL(clone->to_json_entity(), original.to_json_entity());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ModelListTests)

BOOST_AUTO_TEST_CASE(test_list_models) {
    auto model = ListModel::from_json_entity(
        {{"Field1", json::array({{{"Field1", 1}}, {{"Field2", 2}}})}});

    auto items = model.Field1();
    BOOST_REQUIRE_EQUAL(items.size(), 2u);
    BOOST_CHECK_EQUAL(items[0]->Field1(), json(1));
    BOOST_CHECK(items[0]->Field2().is_null());
    BOOST_CHECK_EQUAL(items[1]->Field2(), json(2));
    BOOST_CHECK(items[1]->Field1().is_null());

    BOOST_CHECK_EQUAL(model.to_json_entity(),
                      json({{"Field1", json::array({{{"Field1", 1}}, {{"Field2", 2}}})}}));
}

BOOST_AUTO_TEST_CASE(test_list_preserves_order) {
    json list = json::array();
    for (int i = 0; i < 10; ++i) {
        list.push_back({{"Field1", i}});
    }
    auto model = ListModel::from_json_entity({{"Field1", list}});

    auto items = model.Field1();
    BOOST_REQUIRE_EQUAL(items.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        BOOST_CHECK_EQUAL(items[i]->Field1(), json(i));
    }
    BOOST_CHECK_EQUAL(model.to_json_entity()["Field1"], list);
}

BOOST_AUTO_TEST_CASE(test_empty_list) {
    auto model = ListModel::from_json_entity({{"Field1", json::array()}});
    BOOST_CHECK(model.Field1().empty());
    BOOST_CHECK(model.is_set("Field1"));
    BOOST_CHECK_EQUAL(model.to_json_entity(), json({{"Field1", json::array()}}));
}

BOOST_AUTO_TEST_CASE(test_list_setter) {
    ListModel model;
    BOOST_CHECK(model.Field1().empty());

    model.set_Field1({TestModel1::create({{"Field1", "a"}}), TestModel1()});

    BOOST_CHECK_EQUAL(model.Field1().size(), 2u);
    BOOST_CHECK_EQUAL(model.to_json_entity(),
                      json({{"Field1", json::array({{{"Field1", "a"}}, json::object()})}}));
}

BOOST_AUTO_TEST_CASE(test_list_requires_array_of_objects) {
    BOOST_CHECK_THROW(ListModel::from_json_entity({{"Field1", {{"Field1", 1}}}}),
                      ConversionTypeMismatch);
    BOOST_CHECK_THROW(ListModel::from_json_entity({{"Field1", 5}}),
                      ConversionTypeMismatch);
    BOOST_CHECK_THROW(
        ListModel::from_json_entity({{"Field1", json::array({{{"Field1", 1}}, 2})}}),
        ConversionTypeMismatch);
}

BOOST_AUTO_TEST_CASE(test_list_holding_non_list_fails_to_serialize) {
    ListModel model;
    model.set_value("Field1", 5);
    BOOST_CHECK_THROW(model.to_json_entity(), ConversionTypeMismatch);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConstructionTests)

BOOST_AUTO_TEST_CASE(test_from_entity_requires_object) {
    BOOST_CHECK_THROW(TestModel1::from_json_entity(json::array({1, 2})),
                      InvalidInputType);
    BOOST_CHECK_THROW(TestModel1::from_json_entity(json("text")), InvalidInputType);
    BOOST_CHECK_THROW(TestModel1::from_json_entity(json(nullptr)), InvalidInputType);
    BOOST_CHECK_THROW(TestModel1::from_json_entity(json(1)), InvalidInputType);
}

BOOST_AUTO_TEST_CASE(test_create_goes_through_setters) {
    auto model = NestedModel::create(
        {{"Field1", 1},
         {"Field2", "two"},
         {"Field3", TestModel1::create({{"Field2", 3}})}});

    BOOST_CHECK_EQUAL(model.Field1(), json(1));
    BOOST_CHECK_EQUAL(model.Field2().get<std::string>(), "two");
    BOOST_REQUIRE(model.Field3() != nullptr);
    BOOST_CHECK_EQUAL(model.Field3()->Field2(), json(3));
}

BOOST_AUTO_TEST_CASE(test_create_with_unknown_field) {
    BOOST_CHECK_THROW(TestModel1::create({{"Field9", 1}}), UnknownFieldError);
}

BOOST_AUTO_TEST_CASE(test_initializer_uses_internal_key) {
    auto model = RenamedModel::create({{"Field2", "value"}});
    BOOST_CHECK_EQUAL(model.to_json_entity(), json({{"field_2", "value"}}));
    BOOST_CHECK_THROW(RenamedModel::create({{"field_2", "value"}}), UnknownFieldError);
}

BOOST_AUTO_TEST_CASE(test_generic_value_access) {
    TestModel1 model;
    BOOST_CHECK(model.value("Field1").is_null());
    BOOST_CHECK_THROW(model.value("Missing"), UnknownFieldError);
    BOOST_CHECK_THROW(model.is_set("Missing"), UnknownFieldError);

    model.set_value("Field1", "generic");
    BOOST_CHECK_EQUAL(model.Field1().get<std::string>(), "generic");
    BOOST_CHECK_EQUAL(model.value("Field1").json().get<std::string>(), "generic");
}

BOOST_AUTO_TEST_CASE(test_scalar_holding_model_fails_to_serialize) {
    TestModel1 model;
    model.set_value("Field1", TestModel1());
    BOOST_CHECK_THROW(model.to_json_entity(), ConversionTypeMismatch);
    BOOST_CHECK_THROW(model.Field1(), ConversionTypeMismatch);
}

BOOST_AUTO_TEST_SUITE_END()
