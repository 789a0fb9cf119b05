#include <catch2/catch.hpp>

#include "medical_extractor.hpp"

#include <string>

TEST_CASE("Lab result lines", "[medical]") {
    MedicalExtractor extractor;

    SECTION("value, unit and reference range") {
        std::vector<LabTestResult> results = extractor.extractLabResults(
            "LABORATOR\nREZULTATE\nHemoglobina: 14.2 g/dL (12-16)");
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].test_name == "Hemoglobina");
        REQUIRE(results[0].normalized_name == "hemoglobin");
        REQUIRE(results[0].value == "14.2");
        REQUIRE(results[0].unit == "g/dL");
        REQUIRE(results[0].reference_min == "12");
        REQUIRE(results[0].reference_max == "16");
        REQUIRE(results[0].status == "normal");
    }

    SECTION("decimal commas and statuses") {
        std::vector<LabTestResult> results = extractor.extractLabResults(
            "Glicemie: 110,5 mg/dL (70-110)\n"
            "Hemoglobină 10.1 g/dL (12 - 16)\n"
            "Creatinină: 0,9 mg/dL (Interval: 0,6-1,2)\n");
        REQUIRE(results.size() == 3);

        REQUIRE(results[0].normalized_name == "blood_glucose");
        REQUIRE(results[0].value == "110.5");
        REQUIRE(results[0].status == "high");

        REQUIRE(results[1].test_name == "Hemoglobină");
        REQUIRE(results[1].status == "low");

        REQUIRE(results[2].normalized_name == "creatinine");
        REQUIRE(results[2].value == "0.9");
        REQUIRE(results[2].reference_min == "0.6");
        REQUIRE(results[2].reference_max == "1.2");
        REQUIRE(results[2].status == "normal");
    }

    SECTION("bullets, missing unit or range") {
        std::vector<LabTestResult> results = extractor.extractLabResults(
            "- Leucocite: 7.2 (4-10)\n"
            "Colesterol 180 mg/dL\n");
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].normalized_name == "white_blood_cells");
        REQUIRE(results[0].unit.empty());
        REQUIRE(results[0].status == "normal");

        REQUIRE(results[1].normalized_name == "cholesterol");
        REQUIRE(results[1].unit == "mg/dL");
        REQUIRE(results[1].reference_min.empty());
        REQUIRE(results[1].status == "unknown");
    }

    SECTION("unknown tests get a snake_case key") {
        std::vector<LabTestResult> results = extractor.extractLabResults("Feritina serica: 45 ng/mL (20-200)");
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].normalized_name == "feritina_serica");
    }

    SECTION("loose spacing and trailing text") {
        std::vector<LabTestResult> results = extractor.extractLabResults(
            "Hemoglobina:14.2 g/dL (12-16)\n"
            "Leucocite: 7.2 (4-10) Normal\n"
            "Glicemie 95 mg/dL 70-110\n");
        REQUIRE(results.size() == 3);

        REQUIRE(results[0].test_name == "Hemoglobina");
        REQUIRE(results[0].value == "14.2");
        REQUIRE(results[0].status == "normal");

        REQUIRE(results[1].normalized_name == "white_blood_cells");
        REQUIRE(results[1].reference_max == "10");
        REQUIRE(results[1].status == "normal");

        REQUIRE(results[2].value == "95");
        REQUIRE(results[2].unit == "mg/dL");
        REQUIRE(results[2].reference_min.empty());
        REQUIRE(results[2].status == "unknown");
    }

    SECTION("lines without a measurement are ignored") {
        REQUIRE(extractor.extractLabResults("LABORATOR\nPacient: Ion Popescu\nData: 12.03.2024").empty());
        REQUIRE(extractor.extractLabResults("").empty());
    }
}

TEST_CASE("Result status", "[medical]") {
    REQUIRE(MedicalExtractor::determineResultStatus("5", "1", "10") == "normal");
    REQUIRE(MedicalExtractor::determineResultStatus("1", "1", "2") == "normal");
    REQUIRE(MedicalExtractor::determineResultStatus("2", "1", "2") == "normal");
    REQUIRE(MedicalExtractor::determineResultStatus("0.5", "1", "2") == "low");
    REQUIRE(MedicalExtractor::determineResultStatus("2,5", "1", "2") == "high");
    REQUIRE(MedicalExtractor::determineResultStatus("abc", "1", "2") == "unknown");
    REQUIRE(MedicalExtractor::determineResultStatus("1", "", "2") == "unknown");
}

TEST_CASE("Medication lines", "[medical]") {
    MedicalExtractor extractor;

    std::vector<MedicationEntry> meds = extractor.extractMedications(
        "Tratament:\n"
        "Paracetamol 500 mg 20 tablete\n"
        "Ibuprofen 400mg\n"
        "Nurofen 200 mg\n"
        "Amoxicilină 3 capsule\n"
        "Se administreaza dupa masa\n");

    REQUIRE(meds.size() == 4);

    REQUIRE(meds[0].medication_name == "Paracetamol");
    REQUIRE(meds[0].normalized_name == "acetaminophen");
    REQUIRE(meds[0].dosage == "500 mg");
    REQUIRE(meds[0].quantity == "20");
    REQUIRE(meds[0].recognized);

    REQUIRE(meds[1].medication_name == "Ibuprofen");
    REQUIRE(meds[1].dosage == "400mg");
    REQUIRE(meds[1].quantity.empty());

    REQUIRE(meds[2].medication_name == "Nurofen");
    REQUIRE_FALSE(meds[2].recognized);
    REQUIRE(meds[2].normalized_name.empty());

    REQUIRE(meds[3].normalized_name == "amoxicillin");
    REQUIRE(meds[3].dosage.empty());
    REQUIRE(meds[3].quantity == "3");
}

TEST_CASE("Medication names need a capital letter", "[medical]") {
    MedicalExtractor extractor;

    SECTION("lowercase words with diacritics") {
        REQUIRE(extractor.extractMedications("doză 500 mg").empty());
        REQUIRE(extractor.extractMedications("în 2 tablete").empty());
        REQUIRE(extractor.extractMedications("și 10 mg pe zi").empty());
    }

    SECTION("diacritic capital") {
        std::vector<MedicationEntry> meds = extractor.extractMedications("Ștefanol 10 mg");
        REQUIRE(meds.size() == 1);
        REQUIRE(meds[0].medication_name == "Ștefanol");
        REQUIRE(meds[0].dosage == "10 mg");
        REQUIRE_FALSE(meds[0].recognized);
    }

    SECTION("name after a heading word") {
        std::vector<MedicationEntry> meds = extractor.extractMedications("Tratament Paracetamol 500 mg");
        REQUIRE(meds.size() == 1);
        REQUIRE(meds[0].medication_name == "Paracetamol");
        REQUIRE(meds[0].recognized);
    }
}

TEST_CASE("Medical terms", "[medical]") {
    MedicalExtractor extractor;

    std::vector<std::string> terms = extractor.findMedicalTerms(
        "PARACETAMOL 500 mg\nHemoglobina: 14.2\nGLICEMIE 90");
    REQUIRE(terms.size() == 3);
    REQUIRE(terms[0] == "hemoglobină");
    REQUIRE(terms[1] == "glicemie");
    REQUIRE(terms[2] == "paracetamol");

    REQUIRE(extractor.isLabTestTerm("hemoglobină"));
    REQUIRE_FALSE(extractor.isLabTestTerm("paracetamol"));
    REQUIRE(extractor.isMedicationTerm("paracetamol"));

    REQUIRE(extractor.findMedicalTerms("Nimic relevant aici").empty());

    REQUIRE(extractor.normalizeTestName("Proteina C Reactivă") == "c_reactive_protein");
    REQUIRE(extractor.normalizeTestName("VITEZA SEDIMENTARII") == "erythrocyte_sedimentation_rate");
}
