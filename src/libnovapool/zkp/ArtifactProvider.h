#pragma once

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/beast/utility/Journal.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace novapool {
namespace zkp {

struct DownloadProgress
{
    std::uint64_t loaded = 0;
    std::uint64_t total = 0;  // 0 when unknown
    int percent = 0;
    std::string message;
};

using ProgressCallback = std::function<void(DownloadProgress const&)>;

/** Raw transport for artifacts (HTTP client, file system...). */
class ArtifactSource
{
public:
    using ChunkCallback =
        std::function<void(std::uint64_t loaded, std::uint64_t total)>;

    virtual ~ArtifactSource() = default;

    virtual ripple::Blob
    fetch(std::string const& url, ChunkCallback const& onChunk) = 0;
};

/** Artifact access as seen by the prover worker. */
class ArtifactProvider
{
public:
    virtual ~ArtifactProvider() = default;

    /** @throws PoolError(ArtifactFetchError) */
    virtual ripple::Blob
    fetchWithProgress(std::string const& url, ProgressCallback const& progress) = 0;

    virtual bool
    isCached(std::string const& url) const = 0;

    virtual void
    clearCache() = 0;
};

/**
 * Content-addressed cache in front of an ArtifactSource.
 *
 * Blobs are stored under their SHA-256 digest; a URL index maps each
 * fetched URL to its digest. When a cache directory is configured the
 * blobs and the index are mirrored there and survive restarts.
 * Progress is reported at most once per whole percent.
 */
class CachingArtifactProvider : public ArtifactProvider
{
public:
    CachingArtifactProvider(
        std::shared_ptr<ArtifactSource> source,
        std::string cacheDir,
        beast::Journal journal);

    ripple::Blob
    fetchWithProgress(std::string const& url, ProgressCallback const& progress)
        override;

    bool
    isCached(std::string const& url) const override;

    void
    clearCache() override;

    /** Digest recorded for a URL, if it was fetched. */
    std::optional<ripple::uint256>
    digestOf(std::string const& url) const;

private:
    std::optional<ripple::Blob>
    lookup(std::string const& url) const;

    void
    store(std::string const& url, ripple::Blob const& blob);

    void
    loadIndex();

    void
    saveIndex() const;

    std::string
    blobPath(ripple::uint256 const& digest) const;

    std::shared_ptr<ArtifactSource> source_;
    std::string cacheDir_;
    beast::Journal j_;

    mutable std::mutex mutex_;
    std::map<std::string, ripple::uint256> index_;
    std::map<ripple::uint256, ripple::Blob> blobs_;
};

/** Reads artifacts from the local file system ("file://" or plain paths). */
class FileArtifactSource : public ArtifactSource
{
public:
    explicit FileArtifactSource(std::size_t chunkSize = 1 << 20)
        : chunkSize_(chunkSize)
    {
    }

    ripple::Blob
    fetch(std::string const& url, ChunkCallback const& onChunk) override;

private:
    std::size_t chunkSize_;
};

/** SHA-256 of a blob, as used for cache addressing. */
ripple::uint256
sha256Digest(ripple::Blob const& blob);

}  // namespace zkp
}  // namespace novapool
