#include "../include/guardian/verifier.hpp"

#include <iostream>

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: guardian_verify <bundle_dir>\n";
        return 2;
    }
    const guardian::VerificationReport report = guardian::verify_bundle(argv[1]);
    std::cout << guardian::to_json(report).dump() << '\n';
    return report.final_pass ? 0 : 1;
}
