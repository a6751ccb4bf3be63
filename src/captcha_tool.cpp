#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "captcha_config.hpp"
#include "captcha_errors.hpp"
#include "challenge_service.hpp"
#include "commitment_codec.hpp"
#include "image_renderer.hpp"
#include "verification_service.hpp"

using namespace captcha;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage:\n"
              << "  " << prog << " create [--config FILE] [--out FILE] [--secret S]\n"
              << "  " << prog << " verify TOKEN ANSWER [--secret S]\n"
              << "\nCAPTCHA_SECRET is used when --secret is not given.\n";
}

std::string default_secret() {
    const char* env = std::getenv("CAPTCHA_SECRET");
    return env ? env : "";
}

int run_create(const std::vector<std::string>& args) {
    std::string config_path;
    std::string out_path = "captcha.png";
    std::string secret = default_secret();

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--out" && i + 1 < args.size()) {
            out_path = args[++i];
        } else if (args[i] == "--secret" && i + 1 < args.size()) {
            secret = args[++i];
        } else {
            std::cerr << "[-] Unknown argument: " << args[i] << std::endl;
            return 1;
        }
    }

    ChallengeConfig config = config_path.empty() ? ChallengeConfig::defaults()
                                                 : ChallengeConfig::load_file(config_path);

    RasterRenderer renderer;
    CommitmentCodec codec(secret);
    ChallengeService service(renderer, codec);

    ChallengeResult result = service.create_challenge(config, "internal");

    std::ofstream out(out_path, std::ios::binary);
    if (!out) {
        std::cerr << "[-] Cannot open " << out_path << " for writing" << std::endl;
        return 1;
    }
    out.write(reinterpret_cast<const char*>(result.image.data()),
              static_cast<std::streamsize>(result.image.size()));
    if (!out) {
        std::cerr << "[-] Failed writing " << out_path << std::endl;
        return 1;
    }

    std::cout << "[+] Image: " << out_path << " (" << result.mime_type << ", "
              << result.image.size() << " bytes)" << std::endl;
    std::cout << result.token << std::endl;
    return 0;
}

int run_verify(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "[-] verify needs TOKEN and ANSWER" << std::endl;
        return 1;
    }
    std::string token = args[0];
    std::string answer = args[1];
    std::string secret = default_secret();

    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--secret" && i + 1 < args.size()) {
            secret = args[++i];
        } else {
            std::cerr << "[-] Unknown argument: " << args[i] << std::endl;
            return 1;
        }
    }

    CommitmentCodec codec(secret);
    VerificationService verifier(codec);

    if (verifier.verify_answer(token, answer, "internal")) {
        std::cout << "VALID" << std::endl;
        return 0;
    }
    std::cout << "INVALID" << std::endl;
    return 2;
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "create") {
            return run_create(args);
        }
        if (command == "verify") {
            return run_verify(args);
        }
        if (command == "--help" || command == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        print_usage(argv[0]);
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "[-] Config error: " << e.what() << std::endl;
        for (const auto& key : e.offending_keys()) {
            std::cerr << "    unknown key: " << key << std::endl;
        }
        return 1;
    } catch (const RenderConfigError& e) {
        std::cerr << "[-] Render error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
