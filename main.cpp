#include "document_engine.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--hint=<type>] [--timeout=<ms>] [--tessdata=<dir>] <image>\n";
}

bool readFile(const std::string& path, std::vector<uint8_t>& bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::string imagePath;
        std::string hint;
        ProcessingOptions options;
        TesseractOptions tesseract;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--hint=", 0) == 0) {
                hint = arg.substr(std::string("--hint=").size());
            } else if (arg.rfind("--timeout=", 0) == 0) {
                options.timeout_ms = std::stoi(arg.substr(std::string("--timeout=").size()));
            } else if (arg.rfind("--tessdata=", 0) == 0) {
                tesseract.tessdata_path = arg.substr(std::string("--tessdata=").size());
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 2;
            } else if (imagePath.empty()) {
                imagePath = arg;
            }
        }

        if (imagePath.empty()) {
            printUsage(argv[0]);
            return 2;
        }

        std::vector<uint8_t> bytes;
        if (!readFile(imagePath, bytes)) {
            std::cerr << "Image not found: " << imagePath << "\n";
            printUsage(argv[0]);
            return 2;
        }

        DocumentEngine engine(tesseract);
        ProcessingOutcome outcome = engine.process(bytes.data(), bytes.size(), hint, options);

        std::cout << toJson(outcome) << "\n";
        return outcome.success ? 0 : 1;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Invalid number: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
