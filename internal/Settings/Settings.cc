#include "Settings.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace Meow
{
    Settings::Settings()
    {
        this->ecc_enabled_ = !env_flag("MEOW_DISABLE_ECC", false);
        this->verbose_ = env_flag("MEOW_VERBOSE", false);
    }

    bool Settings::env_flag(const char* name, bool fallback)
    {
        const char* raw = std::getenv(name);
        if (raw == nullptr || *raw == '\0')
            return fallback;

        std::string value(raw);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return value == "1" || value == "on" || value == "yes" || value == "true";
    }

    std::string Settings::describe() const
    {
        std::ostringstream oss;
        oss << "ecc: " << (this->ecc_enabled_ ? "enabled" : "disabled (MEOW_DISABLE_ECC)")
            << ", verbose: " << (this->verbose_ ? "on" : "off");
        return oss.str();
    }
} // Meow
