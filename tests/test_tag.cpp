#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "nbt/tag.hpp"

using namespace nbt;

template<typename F>
auto throws(error_kind kind, F&& f) -> bool {
    try {
        f();
    } catch (const nbt_error& e) {
        return e.kind() == kind;
    }
    return false;
}

// =============================================================================
// Kinds
// =============================================================================

void test_kind_mapping() {
    std::cout << "Testing value type to kind mapping... ";
    assert(tag_t(int8_t{1}).kind() == tag_kind::byte);
    assert(tag_t(int16_t{1}).kind() == tag_kind::short_);
    assert(tag_t(int32_t{1}).kind() == tag_kind::int_);
    assert(tag_t(int64_t{1}).kind() == tag_kind::long_);
    assert(tag_t(1.0f).kind() == tag_kind::float_);
    assert(tag_t(1.0).kind() == tag_kind::double_);
    assert(tag_t(byte_array_t{1, 2}).kind() == tag_kind::byte_array);
    assert(tag_t("text").kind() == tag_kind::string);
    assert(tag_t(list_t(tag_kind::int_)).kind() == tag_kind::list);
    assert(tag_t(compound_t{}).kind() == tag_kind::compound);
    assert(tag_t(int_array_t{1}).kind() == tag_kind::int_array);
    assert(tag_t(long_array_t{1}).kind() == tag_kind::long_array);
    std::cout << "PASSED\n";
}

void test_kind_names() {
    std::cout << "Testing kind names... ";
    assert(std::string(to_string(tag_kind::end)) == "TAG_End");
    assert(std::string(to_string(tag_kind::byte_array)) == "TAG_Byte_Array");
    assert(std::string(to_string(tag_kind::compound)) == "TAG_Compound");
    assert(from_string(std::type_identity<tag_kind>{}, "TAG_Long_Array") == tag_kind::long_array);
    assert(is_valid_kind(12));
    assert(!is_valid_kind(13));
    std::cout << "PASSED\n";
}

void test_typed_access() {
    std::cout << "Testing typed access... ";
    auto t = tag_t(int32_t{42});
    assert(t.is<int32_t>());
    assert(t.as<int32_t>() == 42);
    assert(t.get_if<int64_t>() == nullptr);
    assert(throws(error_kind::type_mismatch, [&] { t.as<std::string>(); }));
    std::cout << "PASSED\n";
}

// =============================================================================
// Lists
// =============================================================================

void test_list_homogeneity() {
    std::cout << "Testing list homogeneity... ";
    auto list = list_t(tag_kind::string);
    list.push_back("a");
    list.push_back(tag_t("b"));
    assert(list.size() == 2);
    assert(throws(error_kind::type_mismatch, [&] { list.push_back(tag_t(int32_t{1})); }));
    assert(throws(error_kind::type_mismatch, [&] { list.push_back(compound_t{}); }));
    assert(list.size() == 2);
    std::cout << "PASSED\n";
}

void test_list_coercion() {
    std::cout << "Testing list numeric coercion... ";
    auto ints = list_t(tag_kind::int_);
    ints.push_back(5);
    ints.push_back(int8_t{6});
    ints.push_back(int64_t{7});
    assert(ints[0].is<int32_t>() && ints[1].is<int32_t>() && ints[2].is<int32_t>());
    assert(ints[2].as<int32_t>() == 7);

    auto bytes = list_t(tag_kind::byte);
    bytes.push_back(127);
    assert(throws(error_kind::type_mismatch, [&] { bytes.push_back(128); }));
    assert(throws(error_kind::type_mismatch, [&] { bytes.push_back(-129); }));
    assert(throws(error_kind::type_mismatch, [&] { bytes.push_back(1.5); }));

    auto floats = list_t(tag_kind::float_);
    floats.push_back(3);
    floats.push_back(2.5);
    assert(floats[0].as<float>() == 3.0f);
    assert(floats[1].as<float>() == 2.5f);
    assert(throws(error_kind::type_mismatch, [&] { floats.push_back(1e300); }));

    auto longs = list_t(tag_kind::long_);
    longs.push_back(std::numeric_limits<int64_t>::min());
    assert(throws(error_kind::type_mismatch, [&] { longs.push_back(std::numeric_limits<uint64_t>::max()); }));
    std::cout << "PASSED\n";
}

void test_list_elements_unnamed() {
    std::cout << "Testing list elements carry no name... ";
    auto parent = compound_t{};
    auto& named = parent.insert("x", tag_t(int32_t{1}));
    assert(named.name() && *named.name() == "x");

    auto list = list_t(tag_kind::int_);
    list.push_back(named);
    assert(!list[0].name());
    std::cout << "PASSED\n";
}

void test_end_list() {
    std::cout << "Testing TAG_End list stays empty... ";
    auto list = list_t();
    assert(list.element_kind() == tag_kind::end);
    assert(list.empty());
    assert(throws(error_kind::type_mismatch, [&] { list.push_back(1); }));
    assert(throws(error_kind::type_mismatch, [&] { list.push_back(tag_t("x")); }));
    std::cout << "PASSED\n";
}

void test_list_access() {
    std::cout << "Testing list access... ";
    auto list = list_t(tag_kind::short_, {tag_t(int16_t{1}), tag_t(int16_t{2}), tag_t(int16_t{3})});
    assert(list.size() == 3);
    list.erase(1);
    assert(list.size() == 2);
    assert(list.at(1).as<int16_t>() == 3);

    bool out_of_range = false;
    try {
        list.at(5);
    } catch (const std::out_of_range&) {
        out_of_range = true;
    }
    assert(out_of_range);
    std::cout << "PASSED\n";
}

void test_list_set() {
    std::cout << "Testing list element replacement... ";
    auto xs = list_t(tag_kind::int_);
    xs.push_back(5);
    assert(throws(error_kind::type_mismatch, [&] { xs.set(0, tag_t(std::string("hello"))); }));
    assert(xs[0].kind() == tag_kind::int_);
    assert(xs[0].as<int32_t>() == 5);

    xs.set(0, int8_t{9});
    assert(xs[0].kind() == tag_kind::int_);
    assert(xs[0].as<int32_t>() == 9);
    assert(throws(error_kind::type_mismatch, [&] { xs.set(0, 0.5); }));

    xs.get<int32_t>(0) = 11;
    assert(xs[0].as<int32_t>() == 11);
    assert(throws(error_kind::type_mismatch, [&] { xs.get<std::string>(0); }));

    bool out_of_range = false;
    try {
        xs.set(3, 1);
    } catch (const std::out_of_range&) {
        out_of_range = true;
    }
    assert(out_of_range);

    auto items = list_t(tag_kind::compound);
    items.push_back(compound_t{});
    items.get<compound_t>(0).insert("id", "minecraft:stone");
    assert(items[0].as<compound_t>().get<std::string>("id") == "minecraft:stone");
    std::cout << "PASSED\n";
}

// Children can only be replaced through set() and insert()
static_assert(std::is_const_v<std::remove_reference_t<decltype(std::declval<list_t&>()[0])>>);
static_assert(std::is_const_v<std::remove_reference_t<decltype(std::declval<list_t&>().at(0))>>);
static_assert(std::is_const_v<std::remove_reference_t<decltype(*std::declval<list_t&>().begin())>>);
static_assert(std::is_const_v<std::remove_reference_t<decltype(std::declval<compound_t&>().at("k"))>>);
static_assert(std::is_const_v<std::remove_reference_t<decltype(*std::declval<compound_t&>().begin())>>);
static_assert(std::is_const_v<std::remove_pointer_t<decltype(std::declval<compound_t&>().find("k"))>>);

// =============================================================================
// Compounds
// =============================================================================

void test_compound_naming() {
    std::cout << "Testing compound insert names the child... ";
    auto c = compound_t{};
    c.insert("k", tag_t(std::optional<std::string>("other"), value_t(int32_t{3})));
    assert(c.at("k").name() == std::optional<std::string>("k"));
    for (const auto& child : c) {
        assert(child.name().has_value());
    }
    std::cout << "PASSED\n";
}

void test_compound_replace() {
    std::cout << "Testing compound replace keeps order... ";
    auto c = compound_t{
        {"a", int32_t{1}},
        {"b", int32_t{2}},
        {"c", int32_t{3}},
    };
    c.insert("b", "replaced");
    assert(c.size() == 3);

    auto names = std::string{};
    for (const auto& child : c) names += *child.name();
    assert(names == "abc");
    assert(c.get<std::string>("b") == "replaced");

    assert(c.erase("a"));
    c.insert("a", int32_t{4});
    names.clear();
    for (const auto& child : c) names += *child.name();
    assert(names == "bca");
    assert(c.get<int32_t>("c") == 3);
    assert(c.get<int32_t>("a") == 4);
    std::cout << "PASSED\n";
}

void test_compound_lookup() {
    std::cout << "Testing compound lookup errors... ";
    auto c = compound_t{{"hp", int16_t{20}}};
    assert(c.contains("hp"));
    assert(c.find("mp") == nullptr);
    assert(throws(error_kind::missing_key, [&] { c.at("mp"); }));
    assert(throws(error_kind::type_mismatch, [&] { c.get<int32_t>("hp"); }));
    assert(c.erase("hp"));
    assert(!c.erase("hp"));
    assert(c.empty());
    std::cout << "PASSED\n";
}

void test_equality() {
    std::cout << "Testing structural equality... ";
    auto a = compound_t{{"x", int32_t{1}}, {"y", "two"}};
    auto b = compound_t{{"y", "two"}, {"x", int32_t{1}}};
    assert(a == b);

    b.insert("x", int64_t{1});
    assert(!(a == b));

    auto l1 = list_t(tag_kind::int_, {tag_t(int32_t{1}), tag_t(int32_t{2})});
    auto l2 = list_t(tag_kind::int_, {tag_t(int32_t{2}), tag_t(int32_t{1})});
    assert(!(l1 == l2));

    // Empty lists of different declared kinds differ
    assert(!(list_t(tag_kind::int_) == list_t(tag_kind::string)));
    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Tag Model ===\n\n";

    test_kind_mapping();
    test_kind_names();
    test_typed_access();

    std::cout << "\n=== Lists ===\n\n";

    test_list_homogeneity();
    test_list_coercion();
    test_list_elements_unnamed();
    test_end_list();
    test_list_access();
    test_list_set();

    std::cout << "\n=== Compounds ===\n\n";

    test_compound_naming();
    test_compound_replace();
    test_compound_lookup();
    test_equality();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
