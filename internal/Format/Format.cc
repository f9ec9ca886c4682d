#include "Format.hh"

namespace Meow
{
    const char* to_string(MeowError error)
    {
        switch (error)
        {
            case MeowError::None:
                return "None";
            case MeowError::InsufficientCapacity:
                return "InsufficientCapacity";
            case MeowError::HeaderUnrecoverable:
                return "HeaderUnrecoverable";
            case MeowError::UncorrectableBlock:
                return "UncorrectableBlock";
            case MeowError::ChecksumMismatch:
                return "ChecksumMismatch";
            case MeowError::CapabilityUnavailable:
                return "CapabilityUnavailable";
            case MeowError::LengthMismatch:
                return "LengthMismatch";
            case MeowError::PayloadTooLarge:
                return "PayloadTooLarge";
        }
        return "Unknown";
    }
} // Meow
