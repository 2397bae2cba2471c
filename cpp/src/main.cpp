#include "sealstream/base64.hpp"
#include "sealstream/cli_colors.hpp"
#include "sealstream/sealstream.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  sealstream enc <file> -p <password> [--out <path>] [--key-size 16|24|32] [--explicit-key-size]\n";
    std::cout << "  sealstream dec <file> -p <password> [--out <path>] [--explicit-key-size]\n";
    std::cout << "  sealstream enc-key <file> -k <base64 key> [--out <path>]\n";
    std::cout << "  sealstream dec-key <file> -k <base64 key> [--out <path>]\n";
    std::cout << "  sealstream enc-text <text> -p <password> [--key-size 16|24|32] [--explicit-key-size]\n";
    std::cout << "  sealstream dec-text <base64> -p <password> [--explicit-key-size]\n";
    std::cout << "  sealstream info <file> [--explicit-key-size]\n";
    std::cout << "  sealstream keygen [--key-size 16|24|32]\n";
    std::cout << "Global flags: --verbose, --no-color\n";
}

struct Args {
    std::string input;
    std::string output;
    std::string password;
    std::string key_base64;
    std::size_t key_size = sealstream::constants::kDefaultKeySize;
    bool explicit_key_size = false;
    bool verbose = false;
};

Args ParseArgs(int argc, char** argv, int start_index, bool needs_input) {
    Args opts;
    int idx = start_index;
    if (needs_input) {
        if (idx >= argc) {
            throw std::runtime_error("Missing input");
        }
        opts.input = argv[idx];
        idx += 1;
    }
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-p" || flag == "--password") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing password value");
            }
            opts.password = argv[idx + 1];
            idx += 2;
        } else if (flag == "-k" || flag == "--key") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing key value");
            }
            opts.key_base64 = argv[idx + 1];
            idx += 2;
        } else if (flag == "--out" || flag == "-o") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing output path");
            }
            opts.output = argv[idx + 1];
            idx += 2;
        } else if (flag == "--key-size") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing key size value");
            }
            opts.key_size = sealstream::ParseKeySize(argv[idx + 1]);
            idx += 2;
        } else if (flag == "--explicit-key-size") {
            opts.explicit_key_size = true;
            idx += 1;
        } else if (flag == "--verbose" || flag == "-v") {
            opts.verbose = true;
            idx += 1;
        } else if (flag == "--no-color") {
            sealstream::cli::SetColorsEnabled(false);
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

sealstream::password::Options PasswordOptions(const Args& args) {
    sealstream::password::Options options;
    options.key_size = args.key_size;
    options.encoding = args.explicit_key_size ? sealstream::password::KeySizeEncoding::kExplicitField
                                              : sealstream::password::KeySizeEncoding::kSaltLength;
    return options;
}

std::string RequirePassword(const Args& args) {
    if (args.password.empty()) {
        throw std::runtime_error("Password is required (-p)");
    }
    return sealstream::ResolvePassword(args.password);
}

sealstream::Bytes RequireKey(const Args& args) {
    if (args.key_base64.empty()) {
        throw std::runtime_error("Key is required (-k)");
    }
    bool ok = false;
    sealstream::Bytes key = sealstream::base64::Decode(args.key_base64, &ok);
    if (!ok) {
        throw std::runtime_error("Key is not valid base64");
    }
    return key;
}

std::string DefaultOutput(const std::string& input, bool encrypting) {
    const std::string ext(sealstream::constants::kEncryptedExt);
    if (encrypting) {
        return input + ext;
    }
    if (input.size() > ext.size() && input.compare(input.size() - ext.size(), ext.size(), ext) == 0) {
        return input.substr(0, input.size() - ext.size());
    }
    return input + ".out";
}

void Report(const Args& args, const std::string& output, std::uint64_t written) {
    if (args.verbose) {
        std::cerr << sealstream::cli::Cyan("wrote " + std::to_string(written) + " bytes", std::cerr) << "\n";
    }
    std::cout << sealstream::cli::Green(output) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "enc" || command == "dec") {
            Args args = ParseArgs(argc, argv, 2, true);
            std::string password = RequirePassword(args);
            bool encrypting = command == "enc";
            std::string output = args.output.empty() ? DefaultOutput(args.input, encrypting) : args.output;
            auto options = PasswordOptions(args);
            if (args.verbose && encrypting) {
                std::cerr << sealstream::cli::Cyan("AES-" + std::to_string(options.key_size * 8) + "-CBC, "
                                                       + (args.explicit_key_size ? "explicit key-size field"
                                                                                 : "key size from salt length"),
                                                   std::cerr)
                          << "\n";
            }
            std::uint64_t written = encrypting
                ? sealstream::EncryptFileWithPassword(args.input, output, password, options)
                : sealstream::DecryptFileWithPassword(args.input, output, password, options);
            Report(args, output, written);
            return 0;
        }
        if (command == "enc-key" || command == "dec-key") {
            Args args = ParseArgs(argc, argv, 2, true);
            sealstream::Bytes key = RequireKey(args);
            bool encrypting = command == "enc-key";
            std::string output = args.output.empty() ? DefaultOutput(args.input, encrypting) : args.output;
            std::uint64_t written = encrypting
                ? sealstream::EncryptFileWithKey(args.input, output, key)
                : sealstream::DecryptFileWithKey(args.input, output, key);
            Report(args, output, written);
            return 0;
        }
        if (command == "enc-text") {
            Args args = ParseArgs(argc, argv, 2, true);
            std::cout << sealstream::EncryptTextWithPassword(args.input, RequirePassword(args), PasswordOptions(args))
                      << "\n";
            return 0;
        }
        if (command == "dec-text") {
            Args args = ParseArgs(argc, argv, 2, true);
            std::cout << sealstream::DecryptTextWithPassword(args.input, RequirePassword(args), PasswordOptions(args))
                      << "\n";
            return 0;
        }
        if (command == "info") {
            Args args = ParseArgs(argc, argv, 2, true);
            auto encoding = PasswordOptions(args).encoding;
            auto info = sealstream::InspectEnvelope(sealstream::ReadFile(args.input), encoding);
            std::cout << "header_len: " << info.header_len << " bytes\n";
            std::cout << "salt_len: " << info.salt_len << " bytes\n";
            std::cout << "key_size: " << info.key_size << " bytes (AES-" << info.key_size * 8 << ")\n";
            std::cout << "iv: " << info.iv_base64 << "\n";
            std::cout << "ciphertext_len: " << info.ciphertext_len << " bytes";
            if (!info.ciphertext_aligned) {
                std::cout << " " << sealstream::cli::Yellow("(not a positive multiple of 16)");
            }
            std::cout << "\n";
            return 0;
        }
        if (command == "keygen") {
            Args args = ParseArgs(argc, argv, 2, false);
            std::cout << sealstream::base64::Encode(sealstream::GenerateKey(args.key_size)) << "\n";
            return 0;
        }
        if (command == "--version") {
            std::cout << "sealstream " << sealstream::constants::kVersion << "\n";
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << sealstream::cli::BoldRed("Error: ", std::cerr) << exc.what() << "\n";
        return 1;
    }
}
