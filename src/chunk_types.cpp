#include "chunk_types.h"

namespace worldstream
{

const char* toString(WarningKind kind) noexcept
{
    switch (kind)
    {
        case WarningKind::MissingObjectArchetype:
            return "missing-object-archetype";
        case WarningKind::UnusableFloorArchetype:
            return "unusable-floor-archetype";
        case WarningKind::SpawnFailed:
            return "spawn-failed";
        case WarningKind::DestroyFailed:
            return "destroy-failed";
        case WarningKind::MissingSnapshotHeight:
            return "missing-snapshot-height";
    }
    return "unknown";
}

} // namespace worldstream
