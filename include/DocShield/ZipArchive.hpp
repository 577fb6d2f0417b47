#pragma once

#include <zip.h>

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {

struct ScanSettings;

struct ZipEntry {
    std::string name;
    std::uint64_t index{0};
    std::uint16_t flags{0};
    std::uint16_t method{0};
    std::uint32_t crc32{0};
    std::uint64_t compressedSize{0};
    std::uint64_t uncompressedSize{0};
    std::time_t modified{0};
    // Only meaningful for members found by ZipReader::salvage.
    std::uint64_t dataOffset{0};
};

struct ZipLimits {
    std::size_t maxEntries{4096};
    std::uint64_t maxEntryBytes{64ull * 1024 * 1024};
    std::uint64_t maxTotalBytes{256ull * 1024 * 1024};
};

ZipLimits zipLimitsFor(const ScanSettings &settings);

// Read-only view over a zip archive held in memory. The archive bytes must
// outlive the reader.
class ZipReader {
  public:
    // Opens the archive through libzip. Throws MalformedContainer.
    static ZipReader open(std::string_view archive, ZipLimits limits = {});
    // Walks local file headers from the start of the buffer; tolerates a
    // missing or damaged central directory.
    static ZipReader salvage(std::string_view archive, ZipLimits limits = {});

    const std::vector<ZipEntry> &entries() const { return entryList; }
    bool truncated() const { return entryCapReached; }
    const ZipEntry *find(const std::string &name) const;

    // Returns the decompressed member. Throws MalformedContainer or
    // ResourceLimitExceeded.
    std::string read(const ZipEntry &entry);

  private:
    struct ArchiveCloser {
        void operator()(zip_t *handle) const { zip_discard(handle); }
    };

    ZipReader(std::string_view archive, ZipLimits limits);
    std::uint64_t remainingBudget() const;
    std::string readIndexed(const ZipEntry &entry, std::uint64_t budget);
    std::string readSalvaged(const ZipEntry &entry, std::uint64_t budget) const;

    std::string_view archive;
    ZipLimits limits;
    std::unique_ptr<zip_t, ArchiveCloser> handle;
    std::vector<ZipEntry> entryList;
    bool entryCapReached{false};
    std::uint64_t inflatedTotal{0};
};

// Builds an archive in memory with libzip. Member timestamps default to a
// fixed date so identical input produces identical output.
class ZipWriter {
  public:
    static constexpr std::uint16_t kStored = 0;
    static constexpr std::uint16_t kDeflated = 8;

    ZipWriter();
    ~ZipWriter();
    ZipWriter(const ZipWriter &) = delete;
    ZipWriter &operator=(const ZipWriter &) = delete;

    void add(const std::string &name, std::string data, std::uint16_t method = kDeflated, std::time_t modified = 0);
    std::size_t size() const { return memberCount; }
    std::string finish();

  private:
    zip_source_t *source{nullptr};
    zip_t *archive{nullptr};
    // libzip reads member data lazily at close time.
    std::deque<std::string> payloads;
    std::size_t memberCount{0};
};

bool looksLikeZip(const std::string &bytes);

} // namespace docshield
