#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relic_asset module

#include <cstdint>

namespace relic_asset {

// Identity
struct SourceId;
class AssetPath;
struct AssetId;
enum class LoadState : std::uint8_t;
struct LoadStatus;
enum class DependencyPolicy : std::uint8_t;
struct LoadOptions;
enum class AssetEventKind : std::uint8_t;
struct AssetEvent;

// Handles
class DropQueue;
struct HandleData;
template<typename T> class Handle;
template<typename T> class WeakHandle;
class UntypedHandle;

// Storage
class AssetEventQueue;
struct ErasedAsset;
class ErasedAssets;
template<typename T> class Assets;

// Byte sources
class AssetIo;
class FileAssetIo;
class MemoryAssetIo;

// Loading
class NestedLoader;
class LoadContext;
template<typename T> class AssetLoader;
class ErasedLoader;
class LoaderRegistry;
template<typename T> class AssetSerializer;
class ErasedSerializer;
class SerializerRegistry;
template<typename T> class Deriver;
class DeriverRegistry;

// Metadata
struct ProducedAsset;
struct DerivedArtifact;
struct AssetSourceMeta;
struct ImportOutcome;
class MetadataStore;

// Graph
struct DependencyEdge;
class DependencyGraph;

// Server
struct AssetServerConfig;
class AssetServer;

} // namespace relic_asset
