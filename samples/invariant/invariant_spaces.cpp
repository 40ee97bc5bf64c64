/**
 * @file invariant_spaces.cpp
 * @brief Print the invariant lines and planes of a linear map
 *
 * Usage:
 *   invariant_spaces                      all presets, 2D and 3D
 *   invariant_spaces shear --3d           one preset
 *   invariant_spaces "2 0 0; 0 2 0; 1 1 3"
 *
 * Matrix text with 4 entries is read as 2x2, with 9 entries as 3x3.
 */

#include <Vectorama/Vectorama.h>

#include <cctype>
#include <iostream>
#include <string>
#include <vector>

using namespace Vectorama;
using namespace Vectorama::Invariant;
using namespace Vectorama::Transform;

namespace {

void PrintUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [preset | \"matrix\"] [--3d]\n\n";
    std::cout << "Presets:";
    for (PresetKind kind : AllPresets()) {
        std::cout << " " << PresetName(kind);
    }
    std::cout << "\nMatrix: rows separated by ';' or newlines, e.g. \"1 0.5; 0 1\"\n";
}

void PrintObjects(const std::vector<InvariantObject>& objects) {
    if (objects.empty()) {
        std::cout << "  (no specific invariant line or plane)\n";
        return;
    }
    for (const auto& obj : objects) {
        std::cout << "  " << Describe(obj) << "\n";
    }
}

template<int N>
void Report(const std::string& title, const Internal::Mat<N>& A) {
    std::cout << title << " [" << FormatMatrix(A) << "]\n";

    if (IsWholeSpaceInvariant(A)) {
        std::cout << "  every line and plane is invariant\n";
        return;
    }

    for (const auto& group : ComputeEigenGroups(A)) {
        std::cout << "  lambda=" << group.eigenvalue
                  << " multiplicity=" << group.algebraicMultiplicity
                  << " eigenspace=" << group.Dimension()
                  << (group.IsDefective() ? " (defective)" : "") << "\n";
    }
    PrintObjects(Assemble(A));
}

void ReportPreset(PresetKind kind, bool threeD) {
    std::string name = PresetName(kind);
    if (threeD) {
        Report(name + " 3x3", Preset3x3(kind));
    } else {
        Report(name + " 2x2", Preset2x2(kind));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== Vectorama Invariant Spaces " << GetVersion() << " ===\n\n";

    bool threeD = false;
    std::string input;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--3d") {
            threeD = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            input = arg;
        }
    }

    try {
        if (input.empty()) {
            for (PresetKind kind : AllPresets()) {
                ReportPreset(kind, false);
                ReportPreset(kind, true);
                std::cout << "\n";
            }
            return 0;
        }

        // A single word is a preset; "nan 0; 0 1" is matrix text
        if (TokenCount(input) == 1 && std::isalpha(static_cast<unsigned char>(input[0]))) {
            ReportPreset(ParsePresetKind(input), threeD);
            return 0;
        }

        int count = EntryCount(input);
        if (count == 4) {
            Report("input 2x2", ParseMatrix2x2(input));
        } else if (count == 9) {
            Report("input 3x3", ParseMatrix3x3(input));
        } else {
            std::cerr << "Error: expected 4 or 9 entries, got " << count << "\n";
            return 1;
        }
    } catch (const ParseException& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        PrintUsage(argv[0]);
        return 1;
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
