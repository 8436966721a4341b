/**
 * @file uid_registry_test.cpp
 * @brief Unit tests for uid_registry lookup and classification
 */

#include <catch2/catch_test_macros.hpp>

#include <dicom_ul/registry/uid_registry.hpp>

#include <string>

using namespace dicom_ul::registry;

namespace {

std::shared_ptr<const uid_registry> standard_registry() {
    return uid_registry::builder{}.with_standard_uids().build();
}

}  // namespace

TEST_CASE("uid_registry lookup of standard UIDs", "[registry][uid_registry]") {
    auto registry = standard_registry();
    REQUIRE(registry->size() > 0);

    SECTION("verification SOP class") {
        auto desc = registry->lookup(uids::verification);
        CHECK(desc.type == uid_type::sop_class);
        CHECK(desc.name == "Verification SOP Class");
        CHECK_FALSE(desc.is_unknown());
        CHECK(desc.to_string() == "Verification SOP Class [1.2.840.10008.1.1]");
    }

    SECTION("transfer syntax attributes") {
        auto implicit = registry->lookup(uids::implicit_vr_little_endian);
        CHECK(implicit.type == uid_type::transfer_syntax);
        CHECK(implicit.implicit_vr);
        CHECK(implicit.little_endian);
        CHECK_FALSE(implicit.encapsulated);

        auto jpeg = registry->lookup("1.2.840.10008.1.2.4.50");
        CHECK(jpeg.encapsulated);
        CHECK_FALSE(jpeg.implicit_vr);
    }

    SECTION("application context name") {
        CHECK(registry->lookup(uids::application_context).type ==
              uid_type::application_context_name);
    }
}

TEST_CASE("uid_registry synthesizes unknown descriptors", "[registry][uid_registry]") {
    auto registry = standard_registry();

    auto desc = registry->lookup("1.2.3.4.5.6.7");
    CHECK(desc.is_unknown());
    CHECK(desc.name == "Unknown");
    CHECK(desc.uid == "1.2.3.4.5.6.7");
    CHECK_FALSE(registry->contains("1.2.3.4.5.6.7"));

    SECTION("malformed strings are still answered") {
        auto bad = registry->lookup("not-a-uid");
        CHECK(bad.is_unknown());
        CHECK_FALSE(uid_registry::is_valid(bad.uid));
    }
}

TEST_CASE("uid_registry strips value padding", "[registry][uid_registry]") {
    auto registry = standard_registry();

    CHECK(trim_uid(std::string("1.2.840.10008.1.2\0", 18)) == "1.2.840.10008.1.2");
    CHECK(trim_uid("1.2.840.10008.1.1 ") == "1.2.840.10008.1.1");
    CHECK(trim_uid("") == "");

    CHECK(registry->contains(std::string("1.2.840.10008.1.2\0", 18)));
    CHECK(registry->lookup("1.2.840.10008.1.1 ").name == "Verification SOP Class");
}

TEST_CASE("uid_registry::is_valid", "[registry][uid_registry]") {
    CHECK(uid_registry::is_valid("1.2.3"));
    CHECK(uid_registry::is_valid("1.2.840.10008.5.1.4.1.1.2"));
    CHECK_FALSE(uid_registry::is_valid(""));
    CHECK_FALSE(uid_registry::is_valid("1.2.a"));
    CHECK_FALSE(uid_registry::is_valid("1.2 3"));
}

TEST_CASE("uid_registry storage categories", "[registry][uid_registry]") {
    auto registry = standard_registry();
    auto category = [&](std::string_view uid) {
        return uid_registry::category_of(registry->lookup(uid));
    };

    CHECK(category(uids::ct_image_storage) == storage_category::image);
    CHECK(category(uids::mr_image_storage) == storage_category::image);
    CHECK(category("1.2.840.10008.5.1.4.1.1.11.1") == storage_category::presentation_state);
    CHECK(category("1.2.840.10008.5.1.4.1.1.88.11") == storage_category::structured_report);
    CHECK(category("1.2.840.10008.5.1.4.1.1.9.1.1") == storage_category::waveform);
    CHECK(category("1.2.840.10008.5.1.4.1.1.104.1") == storage_category::document);
    CHECK(category("1.2.840.10008.5.1.4.1.1.66") == storage_category::raw);

    SECTION("non-storage classes have no category") {
        CHECK(category(uids::verification) == storage_category::none);
        CHECK(category(uids::study_root_find) == storage_category::none);
        CHECK(category(uids::implicit_vr_little_endian) == storage_category::none);
    }

    SECTION("SOP classes outside the DICOM root are private") {
        uid_descriptor vendor;
        vendor.uid = "1.3.6.1.4.1.9590.100.1.2.1";
        vendor.name = "Vendor Image Storage";
        vendor.type = uid_type::sop_class;
        CHECK(uid_registry::category_of(vendor) == storage_category::private_class);
    }

    CHECK(to_string(storage_category::image) == "Image");
}

TEST_CASE("uid_registry::builder", "[registry][uid_registry]") {
    SECTION("private definitions are added") {
        auto registry = uid_registry::builder{}
                            .with_standard_uids()
                            .add("1.3.6.1.4.1.9590.100.1.1", "Private Query", uid_type::sop_class)
                            .build();
        auto desc = registry->lookup("1.3.6.1.4.1.9590.100.1.1");
        CHECK(desc.name == "Private Query");
        CHECK(desc.type == uid_type::sop_class);
        CHECK(registry->contains(uids::verification));
    }

    SECTION("later registrations replace earlier ones") {
        auto registry = uid_registry::builder{}
                            .add("1.2.3", "First", uid_type::sop_class)
                            .add("1.2.3", "Second", uid_type::sop_class, true)
                            .build();
        CHECK(registry->size() == 1);
        CHECK(registry->lookup("1.2.3").name == "Second");
        CHECK(registry->lookup("1.2.3").retired);
    }

    SECTION("an empty builder yields an empty registry") {
        auto registry = uid_registry::builder{}.build();
        CHECK(registry->size() == 0);
        CHECK(registry->lookup(uids::verification).is_unknown());
    }
}

TEST_CASE("uid_descriptor equality compares the UID only", "[registry][uid_descriptor]") {
    uid_descriptor a;
    a.uid = "1.2.3";
    a.name = "One";
    uid_descriptor b;
    b.uid = "1.2.3";
    b.name = "Other";
    b.retired = true;

    CHECK(a == b);
    b.uid = "1.2.4";
    CHECK_FALSE(a == b);
}

TEST_CASE("uid_registry::is_codec_supported", "[registry][uid_registry]") {
    CHECK(uid_registry::is_codec_supported(uids::implicit_vr_little_endian));
    CHECK(uid_registry::is_codec_supported(uids::explicit_vr_little_endian));
    CHECK(uid_registry::is_codec_supported(std::string("1.2.840.10008.1.2.1\0", 20)));
    CHECK_FALSE(uid_registry::is_codec_supported(uids::explicit_vr_big_endian));
    CHECK_FALSE(uid_registry::is_codec_supported("1.2.840.10008.1.2.4.50"));
}
