#ifndef MEOWHNS_SETTINGS_HH
#define MEOWHNS_SETTINGS_HH

#include <string>
#include <defines.hh>

namespace Meow
{
    /**
     * Process-wide settings, read once from the environment.
     * Must be touched before any concurrent embed/extract starts; read-only afterwards.
     */
    class Settings
    {
    private:
        Settings();

        bool ecc_enabled_ = true;
        bool verbose_ = false;

        /**
         * Interpret an environment variable as a boolean switch
         * @param name Variable name
         * @param fallback Value when unset or empty
         * @return true for "1", "on", "yes", "true" (any case)
         */
        static bool env_flag(const char* name, bool fallback);

    public:
        /**
        * Forbidden copy and "=" constructor
        */
        Settings(const Settings&) = delete;
        Settings& operator=(const Settings&) = delete;

        static Settings& getInstance()
        {
            static Settings instance;
            return instance;
        }

        /**
         * @return false when MEOW_DISABLE_ECC is set, the Reed-Solomon backend is then reported absent
         */
        [[nodiscard]] bool ecc_enabled() const
        { return this->ecc_enabled_; }

        /**
         * @return true when MEOW_VERBOSE is set, progress messages go to stdout
         */
        [[nodiscard]] bool verbose() const
        { return this->verbose_; }

        /**
         * Human readable dump for `meow info` and the GUI
         */
        std::string describe() const;
    };
} // Meow

#endif //MEOWHNS_SETTINGS_HH
