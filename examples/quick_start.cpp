/**
 * Vault Hunter - Quick Start
 *
 * Minimal example of using the library from your own program:
 *   - Load the configuration the same way vault-hunter does
 *   - Log in (cached token if still valid, otherwise password prompt)
 *   - Search and print one entry
 *
 * Just copy this pattern into your project!
 */

#include <vaulthunter.h>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    if (argc < 2) {
        std::cerr << "Usage: quick_start PATTERN\n";
        return 1;
    }

    try {
        // =====================================================================
        // STEP 1: Configuration (~/.config/vault-hunter/config.json)
        // =====================================================================
        auto paths = vaulthunter::ConfigPaths::from_environment();
        vaulthunter::Client client(vaulthunter::Config::load(paths));

        // =====================================================================
        // STEP 2: Authenticate
        // =====================================================================
        client.login();

        // =====================================================================
        // STEP 3: Search
        // =====================================================================
        auto matches = client.search(argv[1]);
        if (matches.empty()) {
            std::cout << "No entry matches '" << argv[1] << "'\n";
            return 0;
        }

        for (const auto& path : matches) {
            std::cout << path << "\n";
        }

        // Field names only; values stay in memory
        std::cout << "\nFields of " << matches.front() << ":\n";
        for (const auto& field : client.get(matches.front())) {
            std::cout << "  " << field.first << "\n";
        }
    } catch (const vaulthunter::VaultHunterError& e) {
        std::cerr << "Error (" << vaulthunter::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
