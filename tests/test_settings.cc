#include <cstdlib>

#include "TestUtil.hh"
#include "BlockCodec.hh"
#include "Recovery.hh"
#include "Settings.hh"

using namespace MeowTest;

int main()
{
    // Settings are read once: set the environment before anything touches them.
    setenv("MEOW_DISABLE_ECC", "Yes", 1);
    setenv("MEOW_VERBOSE", "0", 1);

    Suite suite;

    suite.run_test("environment switches", [] {
        const Meow::Settings& settings = Meow::Settings::getInstance();
        return !settings.ecc_enabled() && !settings.verbose() &&
               expect_eq(settings.describe(), std::string("ecc: disabled (MEOW_DISABLE_ECC), verbose: off"), "describe");
    });

    suite.run_test("disabled ECC selects the pass-through codec", [] {
        const Meow::BlockCodec& codec = Meow::detect_block_codec();
        return !codec.available() && expect_eq(codec.name(), std::string("pass-through"), "codec");
    });

    suite.run_test("codec choice is fixed for the process", [] {
        setenv("MEOW_DISABLE_ECC", "0", 1);
        return &Meow::detect_block_codec() == &Meow::detect_block_codec() && !Meow::detect_block_codec().available();
    });

    suite.run_test("disabled capability writes raw mode", [] {
        const Meow::RecoveryOrchestrator orchestrator(Meow::detect_block_codec());
        std::vector<byte> plane = random_bytes(4096, 1);
        const std::vector<byte> payload = random_bytes(300, 2);

        const Meow::EmbedReport report = orchestrator.embed(payload, plane.data(), plane.size());
        if (!report.ok() || report.ecc_applied() || report.notice != Meow::MeowError::CapabilityUnavailable)
            return fail("expected a raw embed with a CapabilityUnavailable notice");

        const Meow::ExtractReport extracted = orchestrator.extract(plane.data(), plane.size());
        return extracted.state == Meow::RecoveryState::Success && same_bytes(extracted.payload, payload, "payload");
    });

    return suite.finish();
}
