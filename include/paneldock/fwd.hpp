#pragma once

#include <string>

namespace paneldock
{

// Panel ids are generated as "<type>-<n>" and are unique across the tree
// and the header dock combined.
using PanelId = std::string;
using SplitId = std::string;

struct Rect;
struct LayoutNode;
struct PanelPlacement;
struct PanelBinding;
struct PanelMetadata;
struct PanelInstance;
struct LayoutPersistence;
struct PanelTypeManifest;
struct WorkspaceConfig;

class PanelRegistry;
class PanelHost;
class KeyValueStorage;
class GeometryProvider;
class PanelWorkspace;

}   // namespace paneldock
