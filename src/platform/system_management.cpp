// EN: Platform selection and parsing helpers shared by the OS collaborators.
// FR: Sélection de plateforme et utilitaires d'analyse partagés par les collaborateurs OS.

#include "platform/system_management.hpp"

#include "infrastructure/system/process_runner.hpp"
#include "orchestrator/workflow_errors.hpp"
#include "platform/linux_system_management.hpp"
#include "platform/windows_system_management.hpp"

#include <nlohmann/json.hpp>

namespace HVC {
namespace Platform {

std::unique_ptr<ISystemManagement> createSystemManagement(IProcessRunner& runner, Logger& logger) {
#if defined(_WIN32)
    return std::make_unique<WindowsSystemManagement>(runner, logger);
#elif defined(__linux__)
    return std::make_unique<LinuxSystemManagement>(runner, logger);
#else
    (void)runner;
    (void)logger;
    throw PreconditionError("Unsupported platform: only Windows and Linux guests are handled");
#endif
}

namespace PlatformUtils {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

OperationResult toOperationResult(const ProcessResult& process) {
    OperationResult result;
    if (!process.started) {
        result.exit_code = -1;
        result.message = process.error;
        return result;
    }

    result.exit_code = process.exit_code;
    result.timed_out = process.timed_out;

    // EN: The last non-empty line is usually the utility's verdict.
    // FR: La dernière ligne non vide est généralement le verdict de l'utilitaire.
    const std::string output = trim(process.output);
    const auto last_break = output.find_last_of('\n');
    result.message = trim(last_break == std::string::npos ? output : output.substr(last_break + 1));
    if (result.timed_out) {
        result.message = "timed out";
    }
    return result;
}

std::string repairUtf8(const std::string& text) {
    static const std::string kReplacement = "\xEF\xBF\xBD";
    std::string repaired;
    repaired.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        }

        bool valid = length > 0 && i + length <= text.size();
        for (size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            const unsigned char min = k == 1 ? low : 0x80;
            const unsigned char max = k == 1 ? high : 0xBF;
            valid = next >= min && next <= max;
        }

        if (valid) {
            repaired.append(text, i, length);
            i += length;
        } else {
            repaired += kReplacement;
            ++i;
        }
    }
    return repaired;
}

nlohmann::json parseJsonList(const std::string& output, const std::string& section) {
    // EN: One stray legacy code page byte must not discard a whole section.
    // FR: Un octet isolé d'une ancienne page de code ne doit pas écarter toute une section.
    const std::string text = repairUtf8(trim(output));
    if (text.empty()) {
        return nlohmann::json::array();
    }

    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw SystemQueryError(section, "utility output is not valid JSON");
    }
    if (parsed.is_null()) {
        return nlohmann::json::array();
    }
    if (parsed.is_object()) {
        return nlohmann::json::array({parsed});
    }
    if (!parsed.is_array()) {
        throw SystemQueryError(section, "unexpected JSON shape");
    }
    return parsed;
}

std::string stringField(const nlohmann::json& object, const std::string& key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

bool boolField(const nlohmann::json& object, const std::string& key, bool fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_number_integer()) {
        return it->get<long long>() != 0;
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        return text == "1" || text == "true" || text == "True";
    }
    return fallback;
}

long long numberField(const nlohmann::json& object, const std::string& key, long long fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number()) {
        return it->get<long long>();
    }
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::logic_error&) {
            return fallback;
        }
    }
    return fallback;
}

std::vector<std::string> stringListField(const nlohmann::json& object, const std::string& key) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return values;
    }
    if (it->is_string()) {
        values.push_back(it->get<std::string>());
        return values;
    }
    if (it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
    }
    return values;
}

} // namespace PlatformUtils

} // namespace Platform
} // namespace HVC
