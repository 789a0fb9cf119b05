#include "document_templates.hpp"
#include "text_utils.hpp"

const char* const kSubtypeElectronic = "carte_electronica";
const char* const kSubtypeStandard = "carte_identitate";
const char* const kSubtypeOldBulletin = "buletin_identitate";

const char* const kDocTypeRomanianId = "romanian_id";
const char* const kDocTypeLabResult = "lab_result";
const char* const kDocTypePrescription = "prescription";

namespace {

// Letter class used inside [...] of field patterns; applied with icase,
// the diacritics are listed in both cases.
const std::string kLetters = "A-Za-zĂăÂâÎîȘșȚțŞşŢţ";
const std::string kDate = "(\\d{2}[./-]\\d{2}[./-]\\d{4})";

// Name capture stays on one line
std::string nameAfter(const std::string& label) {
    return label + "[: \\t]+([" + kLetters + "][" + kLetters + " \\t\\-]*)";
}

const std::string kNameWhitelist =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyzĂÎÂȘȚăîâșț";
const std::string kDigitWhitelist = "0123456789";
const std::string kAddressWhitelist = kNameWhitelist + "0123456789 .,-/";

const int kPsmBlock = 6;
const int kPsmSingleWord = 8;

RegionField makeRegion(const std::string& name, const RegionRect& rect,
                       const std::string& whitelist, int psm) {
    RegionField field;
    field.name = name;
    field.rect = rect;
    field.ocr = FieldOcrConfig(whitelist, psm);
    return field;
}

DocumentTemplate buildIdentityCardTemplate() {
    DocumentTemplate t;
    t.template_id = "ro_identity_card";
    t.document_type = kDocTypeRomanianId;
    t.language = "romanian";
    t.confidence_threshold = 70;
    t.identification_patterns = {
        "ROMANIA|ROUMANIE",
        "CARTE DE IDENTITATE|CARTE D'IDENTITE",
        "IDENTITY CARD",
        "CNP[ \\t:]*\\d{13}",
        "SERIA"
    };
    t.extraction_fields = {
        ExtractionField("nume", {nameAfter("\\bNUME")}, FieldValidator::None, true),
        ExtractionField("prenume", {nameAfter("\\bPRENUME")}, FieldValidator::None, true),
        ExtractionField("cnp", {"CNP[ \\t:]*(\\d{13})"}, FieldValidator::Cnp, true),
        ExtractionField("data_nasterii", {
            "DATA NA(?:S|Ș|Ş|ș|ş)TERII[: \\t]+" + kDate,
            kDate
        }, FieldValidator::None, true),
        ExtractionField("seria", {"\\bSERIA[ \\t]+([A-Z]{2})\\b"}),
        ExtractionField("numar", {"\\bNR[. \\t]*(\\d+)"}),
        ExtractionField("eliberata_de", {
            "ELIBERAT(?:A|Ă|ă) DE[: \\t]+([" + kLetters + "][" + kLetters + " \\t,.\\-]*)",
            "ISSUED BY[: \\t]+([" + kLetters + "][" + kLetters + " \\t,.\\-]*)"
        })
    };
    t.has_post_processing = true;
    t.post_processing.normalize_names = true;
    t.post_processing.validate_cnp_date_consistency = true;
    t.post_processing.extract_gender_from_cnp = true;
    return t;
}

DocumentTemplate buildLabResultTemplate() {
    DocumentTemplate t;
    t.template_id = "ro_lab_results";
    t.document_type = kDocTypeLabResult;
    t.language = "romanian";
    t.confidence_threshold = 65;
    t.identification_patterns = {
        "LABORATOR|ANALIZE|REZULTATE",
        "PACIENT|PATIENT",
        "HEMOGLOBIN|GLICEMIE|COLESTEROL",
        "NORMAL|PATOLOGIC|REFERINTA",
        "MG/DL|G/DL|µL|μL|MMOL/L"
    };
    t.extraction_fields = {
        ExtractionField("nume_pacient", {
            nameAfter("PACIENT"),
            nameAfter("PATIENT"),
            nameAfter("\\bNUME")
        }, FieldValidator::None, true),
        ExtractionField("data_prelevare", {
            "DATA PRELEV(?:A|Ă|ă)RII?[: \\t]*" + kDate,
            "DATA ANALIZEI[: \\t]*" + kDate,
            kDate
        }, FieldValidator::None, true),
        ExtractionField("laborator", {
            "LABORATOR[: \\t]+([" + kLetters + "][" + kLetters + " \\t.,]*)",
            "\\bLAB[: \\t]+([" + kLetters + "][" + kLetters + " \\t.,]*)"
        }),
        ExtractionField("medic", {
            nameAfter("\\bDR\\.?"),
            nameAfter("\\bMEDIC")
        })
    };
    t.has_post_processing = true;
    t.post_processing.extract_test_results = true;
    t.post_processing.identify_abnormal_values = true;
    t.post_processing.map_medical_terms = true;
    return t;
}

DocumentTemplate buildPrescriptionTemplate() {
    DocumentTemplate t;
    t.template_id = "ro_prescription";
    t.document_type = kDocTypePrescription;
    t.language = "romanian";
    t.confidence_threshold = 60;
    t.identification_patterns = {
        "RETETA|PRESCRIPTIE",
        "MEDICAMENT|TRATAMENT",
        "DOZA|ADMINISTRARE",
        "DR\\.|MEDIC",
        "PARACETAMOL|ASPIRIN|IBUPROFEN"
    };
    t.extraction_fields = {
        ExtractionField("nume_pacient", {
            nameAfter("\\bPENTRU"),
            nameAfter("PACIENT")
        }, FieldValidator::None, true),
        ExtractionField("data_prescriere", {
            "\\bDATA[: \\t]*" + kDate
        }, FieldValidator::None, true),
        ExtractionField("medic_prescriptor", {
            nameAfter("\\bDR\\.?"),
            nameAfter("\\bMEDIC")
        }, FieldValidator::None, true)
    };
    t.has_post_processing = true;
    t.post_processing.extract_medications = true;
    t.post_processing.parse_dosage_instructions = true;
    t.post_processing.map_medical_terms = true;
    return t;
}

RegionMap buildStandardCardMap() {
    RegionMap map;
    map.subtype = kSubtypeStandard;
    map.alignment_reference = "romania_text_top";
    map.validates_cnp = true;
    map.fields = {
        makeRegion("nume", RegionRect(0.305f, 0.935f, 0.365f, 0.415f), kNameWhitelist, kPsmSingleWord),
        makeRegion("prenume", RegionRect(0.305f, 0.935f, 0.463f, 0.513f), kNameWhitelist, kPsmSingleWord),
        makeRegion("cnp", RegionRect(0.305f, 0.570f, 0.267f, 0.307f), kDigitWhitelist, kPsmSingleWord),
        makeRegion("address", RegionRect(0.305f, 0.935f, 0.755f, 0.855f), kAddressWhitelist, kPsmBlock)
    };
    map.photo_region = RegionRect(0.035f, 0.280f, 0.155f, 0.800f);
    return map;
}

RegionMap buildElectronicCardMap() {
    RegionMap map;
    map.subtype = kSubtypeElectronic;
    map.alignment_reference = "romania_coat_of_arms";
    map.validates_cnp = true;
    map.fields = {
        makeRegion("nume", RegionRect(0.538f, 0.938f, 0.190f, 0.240f), kNameWhitelist, kPsmSingleWord),
        makeRegion("prenume", RegionRect(0.538f, 0.938f, 0.252f, 0.340f), kNameWhitelist, kPsmSingleWord),
        makeRegion("cnp", RegionRect(0.538f, 0.845f, 0.488f, 0.538f), kDigitWhitelist, kPsmSingleWord)
    };
    map.photo_region = RegionRect(0.048f, 0.485f, 0.155f, 0.590f);
    return map;
}

RegionMap buildOldBulletinMap() {
    RegionMap map;
    map.subtype = kSubtypeOldBulletin;
    map.alignment_reference = "series_number_top";
    map.validates_cnp = false;
    map.fields = {
        makeRegion("nume", RegionRect(0.251f, 0.600f, 0.360f, 0.420f), kNameWhitelist, kPsmSingleWord),
        makeRegion("prenume", RegionRect(0.251f, 0.600f, 0.440f, 0.500f), kNameWhitelist, kPsmSingleWord),
        makeRegion("address", RegionRect(0.620f, 0.950f, 0.360f, 0.500f), kAddressWhitelist, kPsmBlock)
    };
    map.photo_region = RegionRect(0.025f, 0.225f, 0.225f, 0.665f);
    return map;
}

HintResolution hintFor(const char* documentType, const char* subtype) {
    HintResolution h;
    h.document_type = documentType;
    h.subtype = subtype ? subtype : "";
    h.recognized = true;
    return h;
}

}  // namespace

bool DocumentTemplate::isMedical() const {
    return document_type == kDocTypeLabResult || document_type == kDocTypePrescription;
}

const TemplateRegistry& TemplateRegistry::instance() {
    static const TemplateRegistry registry;
    return registry;
}

TemplateRegistry::TemplateRegistry() {
    // Order matters: ties in template scoring go to the earlier entry
    templates_.push_back(buildIdentityCardTemplate());
    templates_.push_back(buildLabResultTemplate());
    templates_.push_back(buildPrescriptionTemplate());

    // Brute-force subtype search order; ties go to the current standard card
    region_maps_.push_back(buildStandardCardMap());
    region_maps_.push_back(buildElectronicCardMap());
    region_maps_.push_back(buildOldBulletinMap());

    medical_tests_ = {
        {"hemoglobină", "hemoglobin"},
        {"hematocrit", "hematocrit"},
        {"leucocite", "white_blood_cells"},
        {"eritrocite", "red_blood_cells"},
        {"trombocite", "platelets"},
        {"glicemie", "blood_glucose"},
        {"colesterol", "cholesterol"},
        {"trigliceride", "triglycerides"},
        {"creatinină", "creatinine"},
        {"uree", "urea"},
        {"bilirubină", "bilirubin"},
        {"transaminaze", "transaminases"},
        {"proteina c reactivă", "c_reactive_protein"},
        {"viteza sedimentării", "erythrocyte_sedimentation_rate"}
    };

    medications_ = {
        {"paracetamol", "acetaminophen"},
        {"ibuprofen", "ibuprofen"},
        {"aspirin", "aspirin"},
        {"amoxicilină", "amoxicillin"},
        {"diclofenac", "diclofenac"},
        {"metamizol", "metamizole"},
        {"omeprazol", "omeprazole"},
        {"enalapril", "enalapril"}
    };

    units_ = {
        {"mg/dL", "milligrams per deciliter"},
        {"g/dL", "grams per deciliter"},
        {"μL", "microliters"},
        {"mmol/L", "millimoles per liter"},
        {"U/L", "units per liter"},
        {"ng/mL", "nanograms per milliliter"},
        {"μg/mL", "micrograms per milliliter"}
    };

    reference_terms_ = {
        {"normal", "normal"},
        {"patologic", "abnormal"},
        {"scăzut", "low"},
        {"crescut", "high"},
        {"în limite normale", "within_normal_limits"},
        {"peste limita normală", "above_normal"},
        {"sub limita normală", "below_normal"}
    };

    quality_keywords_ = {
        "pacient", "patient", "data", "date", "laborator", "laboratory",
        "rezultate", "results", "normal", "analize", "test", "medic",
        "doctor", "spital", "hospital", "diagnostic", "diagnosis"
    };

    ocr_corrections_ = {
        {"ş", "ș"}, {"Ş", "Ș"},
        {"ţ", "ț"}, {"Ţ", "Ț"},
        {"ã", "ă"}, {"Ã", "Ă"},
        {"\\bCNF\\b", "CNP"},
        {"\\bRESULTATE\\b", "REZULTATE"},
        {"\\bLABDRATDR\\b", "LABORATOR"},
        {"\\bHEMDGLDBINA\\b", "HEMOGLOBINĂ"}
    };

    hint_aliases_ = {
        {"carte_identitate", hintFor(kDocTypeRomanianId, kSubtypeStandard)},
        {"carte_electronica", hintFor(kDocTypeRomanianId, kSubtypeElectronic)},
        {"buletin_identitate", hintFor(kDocTypeRomanianId, kSubtypeOldBulletin)},
        {"buletin", hintFor(kDocTypeRomanianId, kSubtypeOldBulletin)},
        {"ci", hintFor(kDocTypeRomanianId, nullptr)},
        {"id_card", hintFor(kDocTypeRomanianId, nullptr)},
        {"identity_card", hintFor(kDocTypeRomanianId, nullptr)},
        {"romanian_id", hintFor(kDocTypeRomanianId, nullptr)},
        {"analize", hintFor(kDocTypeLabResult, nullptr)},
        {"lab", hintFor(kDocTypeLabResult, nullptr)},
        {"laborator", hintFor(kDocTypeLabResult, nullptr)},
        {"lab_result", hintFor(kDocTypeLabResult, nullptr)},
        {"reteta", hintFor(kDocTypePrescription, nullptr)},
        {"rețetă", hintFor(kDocTypePrescription, nullptr)},
        {"prescriptie", hintFor(kDocTypePrescription, nullptr)},
        {"prescription", hintFor(kDocTypePrescription, nullptr)}
    };
}

const DocumentTemplate* TemplateRegistry::findTemplate(const std::string& templateId) const {
    for (const auto& t : templates_) {
        if (t.template_id == templateId) return &t;
    }
    return nullptr;
}

const RegionMap* TemplateRegistry::findRegionMap(const std::string& subtype) const {
    for (const auto& m : region_maps_) {
        if (m.subtype == subtype) return &m;
    }
    return nullptr;
}

HintResolution TemplateRegistry::resolveHint(const std::string& hint) const {
    HintResolution resolution;
    std::string key = foldDiacritics(toLowerRo(trim(hint)));
    if (key.empty()) {
        return resolution;
    }

    for (const auto& alias : hint_aliases_) {
        if (foldDiacritics(alias.first) == key) {
            return alias.second;
        }
    }

    // Unknown hints still steer template priority
    resolution.document_type = hint;
    return resolution;
}
