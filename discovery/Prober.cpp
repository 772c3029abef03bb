#include "Prober.hpp"

namespace lanwatch::discovery
{
    const char *ToString(ProbeError error)
    {
        switch (error)
        {
        case ProbeError::None:
            return "none";
        case ProbeError::Timeout:
            return "timeout";
        case ProbeError::Transport:
            return "transport error";
        case ProbeError::InvalidAddress:
            return "invalid address";
        case ProbeError::PermissionDenied:
            return "permission denied";
        }
        return "unknown";
    }
}
