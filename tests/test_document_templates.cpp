#include <catch2/catch.hpp>

#include "document_templates.hpp"

#include <string>

TEST_CASE("Registry templates", "[templates]") {
    const TemplateRegistry& registry = TemplateRegistry::instance();
    REQUIRE(&registry == &TemplateRegistry::instance());
    REQUIRE(registry.templates().size() == 3);

    const DocumentTemplate* id = registry.findTemplate("ro_identity_card");
    REQUIRE(id != nullptr);
    REQUIRE(id->document_type == "romanian_id");
    REQUIRE(id->confidence_threshold == 70);
    REQUIRE(id->identification_patterns.size() == 5);
    REQUIRE_FALSE(id->isMedical());
    REQUIRE(id->post_processing.extract_gender_from_cnp);

    const DocumentTemplate* lab = registry.findTemplate("ro_lab_results");
    REQUIRE(lab != nullptr);
    REQUIRE(lab->document_type == "lab_result");
    REQUIRE(lab->confidence_threshold == 65);
    REQUIRE(lab->isMedical());
    REQUIRE(lab->post_processing.extract_test_results);

    const DocumentTemplate* rx = registry.findTemplate("ro_prescription");
    REQUIRE(rx != nullptr);
    REQUIRE(rx->document_type == "prescription");
    REQUIRE(rx->confidence_threshold == 60);
    REQUIRE(rx->post_processing.extract_medications);

    REQUIRE(registry.findTemplate("ro_invoice") == nullptr);

    bool cnpValidated = false;
    for (const auto& field : id->extraction_fields) {
        if (field.name == "cnp") {
            cnpValidated = field.validator == FieldValidator::Cnp;
        }
    }
    REQUIRE(cnpValidated);
}

TEST_CASE("Card region maps", "[templates]") {
    const TemplateRegistry& registry = TemplateRegistry::instance();
    const auto& maps = registry.regionMaps();
    REQUIRE(maps.size() == 3);
    REQUIRE(maps[0].subtype == "carte_identitate");
    REQUIRE(maps[1].subtype == "carte_electronica");
    REQUIRE(maps[2].subtype == "buletin_identitate");

    REQUIRE(maps[0].validates_cnp);
    REQUIRE(maps[1].validates_cnp);
    REQUIRE_FALSE(maps[2].validates_cnp);

    for (const auto& map : maps) {
        REQUIRE_FALSE(map.fields.empty());
        for (const auto& field : map.fields) {
            INFO(map.subtype << "/" << field.name);
            REQUIRE(field.rect.x_start >= 0.0f);
            REQUIRE(field.rect.x_end <= 1.0f);
            REQUIRE(field.rect.y_start >= 0.0f);
            REQUIRE(field.rect.y_end <= 1.0f);
            REQUIRE(field.rect.x_start < field.rect.x_end);
            REQUIRE(field.rect.y_start < field.rect.y_end);
            REQUIRE_FALSE(field.ocr.whitelist.empty());
        }
    }

    REQUIRE(registry.findRegionMap("carte_identitate") == &maps[1]);
    REQUIRE(registry.findRegionMap("pasaport") == nullptr);
}

TEST_CASE("Type hint aliases", "[templates][hint]") {
    const TemplateRegistry& registry = TemplateRegistry::instance();

    SECTION("identity card aliases") {
        const char* aliases[] = {"carte_identitate", "carte_electronica", "buletin_identitate",
                                 "buletin", "ci", "id_card", "identity_card", "romanian_id"};
        for (const char* alias : aliases) {
            HintResolution h = registry.resolveHint(alias);
            INFO(alias);
            REQUIRE(h.recognized);
            REQUIRE(h.document_type == "romanian_id");
        }
        REQUIRE(registry.resolveHint("carte_electronica").subtype == "carte_electronica");
        REQUIRE(registry.resolveHint("buletin").subtype == "buletin_identitate");
        REQUIRE(registry.resolveHint("ci").subtype.empty());
    }

    SECTION("lab and prescription aliases") {
        const char* lab[] = {"analize", "lab", "laborator", "lab_result"};
        for (const char* alias : lab) {
            REQUIRE(registry.resolveHint(alias).document_type == "lab_result");
        }
        const char* rx[] = {"reteta", "rețetă", "prescriptie", "prescription"};
        for (const char* alias : rx) {
            REQUIRE(registry.resolveHint(alias).document_type == "prescription");
        }
    }

    SECTION("case and spacing are ignored") {
        REQUIRE(registry.resolveHint("  CI ").document_type == "romanian_id");
        REQUIRE(registry.resolveHint("REȚETĂ").document_type == "prescription");
    }

    SECTION("unknown hints pass through") {
        HintResolution h = registry.resolveHint("Invoice");
        REQUIRE_FALSE(h.recognized);
        REQUIRE(h.document_type == "Invoice");
        REQUIRE(h.subtype.empty());

        HintResolution empty = registry.resolveHint("");
        REQUIRE_FALSE(empty.recognized);
        REQUIRE(empty.document_type.empty());
    }
}

TEST_CASE("Medical vocabulary", "[templates]") {
    const TemplateRegistry& registry = TemplateRegistry::instance();
    REQUIRE(registry.medicalTests().front().first == "hemoglobină");
    REQUIRE(registry.medicalTests().front().second == "hemoglobin");
    REQUIRE(registry.medications().front().second == "acetaminophen");
    REQUIRE_FALSE(registry.units().empty());
    REQUIRE_FALSE(registry.referenceTerms().empty());
    REQUIRE_FALSE(registry.qualityKeywords().empty());
    REQUIRE_FALSE(registry.ocrCorrections().empty());
}
