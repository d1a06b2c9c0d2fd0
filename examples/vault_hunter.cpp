/**
 * Vault Hunter - command line front end
 *
 * Personal password manager on top of HashiCorp Vault.
 *
 *   vault-hunter [options] PATTERN
 *
 * Searches every key under passwords/<username>/ whose name contains
 * PATTERN (case-insensitive). A single match is revealed right away;
 * several matches are listed and one is picked interactively. The
 * "Password" field goes to the clipboard when a clipboard program is
 * available.
 */

#include <vaulthunter.h>

#include <ctime>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string pattern;
    std::string export_file;
    std::string list_path;
    bool list = false;
    bool logout = false;
    bool token_info = false;
    bool list_mounts = false;
    bool health = false;
    bool debug = false;
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: vault-hunter [options] [PATTERN]\n"
       << "\n"
       << "Personal password manager on top of HashiCorp Vault.\n"
       << "\n"
       << "Options:\n"
       << "  --logout          Logout before doing anything\n"
       << "  --token-info      Print token info\n"
       << "  --list-mounts     List mounts\n"
       << "  --health          Print server health\n"
       << "  --list [PATH]     List entries under PATH (default: top level)\n"
       << "  --export FILE     Write every entry to FILE as JSON\n"
       << "  --debug           Print debug log to stderr\n"
       << "  -h, --help        Show this help\n";
}

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--logout") {
            opts.logout = true;
        } else if (arg == "--token-info") {
            opts.token_info = true;
        } else if (arg == "--list-mounts") {
            opts.list_mounts = true;
        } else if (arg == "--health") {
            opts.health = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--export") {
            if (i + 1 >= argc) {
                throw vaulthunter::LocalError("--export expects a file name");
            }
            opts.export_file = argv[++i];
        } else if (arg == "--list") {
            opts.list = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                opts.list_path = argv[++i];
            }
        } else if (!arg.empty() && arg[0] == '-') {
            throw vaulthunter::LocalError("Unknown option: " + arg);
        } else if (opts.pattern.empty()) {
            opts.pattern = arg;
        } else {
            throw vaulthunter::LocalError("Unexpected argument: " + arg);
        }
    }
    return opts;
}

void reveal_path(vaulthunter::Client& client, const vaulthunter::Path& path) {
    auto record = client.get(path);
    for (const auto& [key, value] : record) {
        if (key != vaulthunter::PASSWORD_FIELD) {
            std::cout << key << ": " << value << "\n";
        }
    }

    auto password = record.find(vaulthunter::PASSWORD_FIELD);
    if (password != record.end()) {
        if (vaulthunter::copy_to_clipboard(password->second, client.config())) {
            std::cout << "Password copied to clipboard." << std::endl;
        } else {
            std::cout << "Password: " << password->second << std::endl;
        }
    }
}

// Search for an entry and reveal it
void search_reveal(vaulthunter::Client& client, const std::string& pattern) {
    auto paths = client.search(pattern);
    if (paths.empty()) {
        return;
    }
    if (paths.size() == 1) {
        reveal_path(client, paths[0]);
        return;
    }

    for (size_t i = 0; i < paths.size(); ++i) {
        std::cout << i << ". " << paths[i] << "\n";
    }
    std::cout << std::endl;

    size_t choice = 0;
    while (true) {
        std::string input = vaulthunter::prompt_line("Which entry? ");
        try {
            size_t used = 0;
            choice = std::stoul(input, &used);
            if (used == input.size() && choice < paths.size()) {
                break;
            }
        } catch (const std::logic_error&) {
            // not a number, ask again
        }
        std::cout << "Invalid input" << std::endl;
    }
    reveal_path(client, paths[choice]);
}

void export_entries(vaulthunter::Client& client, const std::string& file) {
    auto entries = client.export_all();
    vaulthunter::write_private_file(file, vaulthunter::export_to_json(entries) + "\n");

    client.set_last_export_time(static_cast<long long>(std::time(nullptr)));
    std::cout << "Exported " << entries.size() << " entries to " << file << std::endl;
}

int run(const Options& opts) {
    auto paths = vaulthunter::ConfigPaths::from_environment();
    auto config = vaulthunter::Config::load(paths);

    if (opts.logout) {
        vaulthunter::Client client(config);
        if (!client.logout_cached()) {
            std::cerr << "Not logged in." << std::endl;
        }
    }

    if (opts.health) {
        vaulthunter::Client client(config);
        std::cout << vaulthunter::to_string(client.health()) << std::endl;
        return 0;
    }
    if (opts.token_info) {
        vaulthunter::Client client(config);
        client.login_cached();
        std::cout << client.lookup_token() << std::endl;
        return 0;
    }
    if (opts.list_mounts) {
        vaulthunter::Client client(config);
        client.login();
        std::cout << client.list_mounts() << std::endl;
        return 0;
    }
    if (opts.list) {
        vaulthunter::Client client(config);
        client.login();
        for (const auto& entry : client.list(vaulthunter::Path::parse(opts.list_path))) {
            std::cout << entry.name << (entry.is_dir() ? "/" : "") << "\n";
        }
        return 0;
    }

    if (!opts.export_file.empty()) {
        vaulthunter::Client client(config);
        client.login();
        export_entries(client, opts.export_file);
        if (opts.pattern.empty()) {
            return 0;
        }
        search_reveal(client, opts.pattern);
        return 0;
    }

    if (opts.pattern.empty()) {
        if (opts.logout) {
            return 0;
        }
        throw vaulthunter::LocalError("Expecting PATTERN");
    }

    vaulthunter::Client client(config);
    client.login();
    search_reveal(client, opts.pattern);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    try {
        Options opts = parse_args(argc, argv);
        if (opts.help) {
            print_usage(std::cout);
            return 0;
        }
        if (opts.debug) {
            vaulthunter::set_debug_mode(true);
        }
        return run(opts);
    } catch (const vaulthunter::VaultHunterError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
