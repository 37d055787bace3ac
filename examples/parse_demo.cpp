#include <iostream>
#include <string>
#include "aamva/aamva.h"
#include "aamva/log.h"

// Example: Parsing a driver's license barcode payload

namespace {

void printField(const char* label, const std::optional<std::string>& value) {
    std::cout << "  " << label << ": " << (value ? *value : std::string("(absent)")) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "AAMVA DL/ID Decoder v" << aamva::VERSION << std::endl;
    std::cout << "========================================" << std::endl;

    if (argc > 1 && std::string(argv[1]) == "--verbose") {
        aamva::setLogLevel(spdlog::level::trace);
    }

    // Payload as delivered by a PDF-417 scanner (record separators are CR)
    std::string sample_payload =
        "@\n\x1e\r"
        "ANSI 636045090002DL00410278ZC03200024DL"
        "DAQ12345678\r"
        "DCSMCDONALD\r"
        "DACRONALD\r"
        "DADO'BRIEN\r"
        "DBB03101970\r"
        "DBA03102030\r"
        "DBD03102022\r"
        "DAG123 N MAIN ST.\r"
        "DAIWINSTON-SALEM\r"
        "DAJNC\r"
        "DAK271010000  \r"
        "DAU070 in\r"
        "DAYBRO\r"
        "ZCZCAXYZ\r";

    std::cout << "\nParsing sample payload..." << std::endl;

    aamva::AAMVAParser parser;
    auto result = parser.parse(sample_payload);

    if (!result.success) {
        std::cout << "[FAILED] " << aamva::errorCodeName(result.error)
                  << ": " << result.error_message << std::endl;
        return 1;
    }

    const auto& id = result.identity;
    std::cout << "\n[SUCCESS] " << aamva::fullDisplayName(id) << std::endl;
    std::cout << "  Issuer: " << id.issuer_id
              << " (AAMVA version " << id.aamva_version << ")" << std::endl;
    printField("Full name", id.full_name);
    printField("Date of birth", aamva::formattedDateOfBirth(id));
    printField("License", id.license_number);
    printField("Expires", id.expiration_date);
    printField("Height", id.height);
    printField("Eyes", id.eye_color);

    auto address = aamva::formattedAddress(id);
    if (address) {
        std::cout << "  Address:\n" << *address << std::endl;
    }

    aamva::normalize::CalendarDate today{2026, 1, 1};
    auto status = aamva::licenseStatus(id, today);
    std::cout << "  Days until expiration (from 2026-01-01): "
              << status.days_until_expiration << std::endl;

    auto years = aamva::age(id, today);
    if (years) {
        std::cout << "  Age on 2026-01-01: " << *years << std::endl;
    }

    return 0;
}
