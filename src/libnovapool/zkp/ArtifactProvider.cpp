#include <libnovapool/zkp/ArtifactProvider.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>
#include <xrpl/json/json_reader.h>
#include <xrpl/json/json_value.h>
#include <xrpl/json/json_writer.h>

#include <openssl/sha.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace novapool {
namespace zkp {

namespace fs = std::filesystem;

namespace {

constexpr char indexFileName[] = "index.json";

class ThrottledProgress
{
public:
    ThrottledProgress(ProgressCallback const& callback, std::string const& url)
        : callback_(callback), url_(url)
    {
    }

    void
    operator()(std::uint64_t loaded, std::uint64_t total)
    {
        if (!callback_)
            return;
        int const percent = total == 0
            ? 0
            : static_cast<int>(
                  std::min<std::uint64_t>(loaded * 100 / total, 100));
        if (percent <= lastPercent_)
            return;
        lastPercent_ = percent;

        DownloadProgress p;
        p.loaded = loaded;
        p.total = total;
        p.percent = percent;
        p.message = "Downloading " + url_;
        callback_(p);
    }

    void
    done(std::uint64_t size, std::string const& message)
    {
        if (!callback_)
            return;
        DownloadProgress p;
        p.loaded = size;
        p.total = size;
        p.percent = 100;
        p.message = message;
        callback_(p);
    }

private:
    ProgressCallback const& callback_;
    std::string const& url_;
    int lastPercent_ = -1;
};

}  // namespace

ripple::uint256
sha256Digest(ripple::Blob const& blob)
{
    ripple::uint256 digest;
    SHA256(blob.data(), blob.size(), digest.data());
    return digest;
}

CachingArtifactProvider::CachingArtifactProvider(
    std::shared_ptr<ArtifactSource> source,
    std::string cacheDir,
    beast::Journal journal)
    : source_(std::move(source)), cacheDir_(std::move(cacheDir)), j_(journal)
{
    if (!source_)
        throw std::invalid_argument(
            "CachingArtifactProvider requires a source");
    if (!cacheDir_.empty())
    {
        fs::create_directories(cacheDir_);
        loadIndex();
    }
}

std::string
CachingArtifactProvider::blobPath(ripple::uint256 const& digest) const
{
    return (fs::path(cacheDir_) / (to_string(digest) + ".bin")).string();
}

void
CachingArtifactProvider::loadIndex()
{
    auto const path = fs::path(cacheDir_) / indexFileName;
    std::ifstream in(path);
    if (!in)
        return;

    std::string const text(
        (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(text, json) || !json.isObject())
    {
        JLOG(j_.warn()) << "Ignoring unreadable artifact index " << path;
        return;
    }

    for (auto const& url : json.getMemberNames())
    {
        ripple::uint256 digest;
        if (!digest.parseHex(json[url].asString()))
            continue;
        if (fs::exists(blobPath(digest)))
            index_[url] = digest;
    }
    JLOG(j_.debug()) << "Artifact cache has " << index_.size() << " entries";
}

void
CachingArtifactProvider::saveIndex() const
{
    Json::Value json(Json::objectValue);
    for (auto const& [url, digest] : index_)
        json[url] = to_string(digest);

    std::ofstream out(fs::path(cacheDir_) / indexFileName, std::ios::trunc);
    out << Json::FastWriter().write(json);
    if (!out)
        JLOG(j_.warn()) << "Could not write artifact index in " << cacheDir_;
}

std::optional<ripple::Blob>
CachingArtifactProvider::lookup(std::string const& url) const
{
    std::lock_guard lock(mutex_);
    auto const it = index_.find(url);
    if (it == index_.end())
        return std::nullopt;

    if (auto const mem = blobs_.find(it->second); mem != blobs_.end())
        return mem->second;

    if (cacheDir_.empty())
        return std::nullopt;

    std::ifstream in(blobPath(it->second), std::ios::binary);
    if (!in)
        return std::nullopt;
    ripple::Blob blob(
        (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (sha256Digest(blob) != it->second)
    {
        JLOG(j_.warn()) << "Cached artifact for " << url << " is corrupt";
        return std::nullopt;
    }
    return blob;
}

void
CachingArtifactProvider::store(std::string const& url, ripple::Blob const& blob)
{
    auto const digest = sha256Digest(blob);

    std::lock_guard lock(mutex_);
    index_[url] = digest;
    blobs_[digest] = blob;

    if (cacheDir_.empty())
        return;

    std::ofstream out(blobPath(digest), std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<char const*>(blob.data()), blob.size());
    if (!out)
    {
        JLOG(j_.warn()) << "Could not persist artifact " << to_string(digest);
        return;
    }
    saveIndex();
}

ripple::Blob
CachingArtifactProvider::fetchWithProgress(
    std::string const& url,
    ProgressCallback const& progress)
{
    ThrottledProgress report(progress, url);

    if (auto cached = lookup(url))
    {
        JLOG(j_.debug()) << "Artifact cache hit: " << url;
        report.done(cached->size(), "Loaded from cache");
        return std::move(*cached);
    }

    JLOG(j_.info()) << "Fetching artifact " << url;
    ripple::Blob blob;
    try
    {
        blob = source_->fetch(
            url, [&report](std::uint64_t loaded, std::uint64_t total) {
                report(loaded, total);
            });
    }
    catch (PoolError const&)
    {
        throw;
    }
    catch (std::exception const& e)
    {
        throw PoolError(
            ErrorCode::ArtifactFetchError,
            "Failed to fetch " + url + ": " + e.what(),
            std::current_exception());
    }

    if (blob.empty())
        throw PoolError(
            ErrorCode::ArtifactFetchError,
            "Empty artifact received from " + url);

    store(url, blob);
    report.done(blob.size(), "Download complete");
    return blob;
}

bool
CachingArtifactProvider::isCached(std::string const& url) const
{
    std::lock_guard lock(mutex_);
    auto const it = index_.find(url);
    if (it == index_.end())
        return false;
    if (blobs_.count(it->second))
        return true;
    return !cacheDir_.empty() && fs::exists(blobPath(it->second));
}

std::optional<ripple::uint256>
CachingArtifactProvider::digestOf(std::string const& url) const
{
    std::lock_guard lock(mutex_);
    auto const it = index_.find(url);
    if (it == index_.end())
        return std::nullopt;
    return it->second;
}

void
CachingArtifactProvider::clearCache()
{
    std::lock_guard lock(mutex_);
    if (!cacheDir_.empty())
    {
        for (auto const& [url, digest] : index_)
        {
            std::error_code ec;
            fs::remove(blobPath(digest), ec);
            if (ec)
                JLOG(j_.warn()) << "Could not remove cached " << url << ": "
                                << ec.message();
        }
        std::error_code ec;
        fs::remove(fs::path(cacheDir_) / indexFileName, ec);
    }
    index_.clear();
    blobs_.clear();
    JLOG(j_.info()) << "Artifact cache cleared";
}

ripple::Blob
FileArtifactSource::fetch(std::string const& url, ChunkCallback const& onChunk)
{
    std::string path = url;
    constexpr char scheme[] = "file://";
    if (path.rfind(scheme, 0) == 0)
        path = path.substr(sizeof(scheme) - 1);

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw PoolError(ErrorCode::ArtifactFetchError, "Cannot open " + path);

    in.seekg(0, std::ios::end);
    auto const total = static_cast<std::uint64_t>(in.tellg());
    in.seekg(0, std::ios::beg);

    ripple::Blob blob;
    blob.reserve(total);
    std::vector<char> chunk(chunkSize_);
    while (in)
    {
        in.read(chunk.data(), chunk.size());
        auto const got = in.gcount();
        if (got <= 0)
            break;
        blob.insert(blob.end(), chunk.data(), chunk.data() + got);
        if (onChunk)
            onChunk(blob.size(), total);
    }
    if (in.bad())
        throw PoolError(ErrorCode::ArtifactFetchError, "Read error on " + path);
    return blob;
}

}  // namespace zkp
}  // namespace novapool
