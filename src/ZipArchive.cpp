#include "DocShield/ZipArchive.hpp"

#include "DocShield/Compression.hpp"
#include "DocShield/ScanDeadline.hpp"
#include "DocShield/ScanSettings.hpp"
#include "DocShield/ScanTypes.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace docshield {

namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50u;
constexpr std::uint32_t kDataDescriptorSignature = 0x08074b50u;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::uint16_t kDataDescriptorFlag = 0x0008;
constexpr std::size_t kReadChunk = 64 * 1024;
// 1980-01-01, the earliest DOS timestamp.
constexpr std::time_t kFixedModified = 315532800;

std::uint16_t readU16(std::string_view data, std::size_t offset) {
    if (offset + 2 > data.size()) {
        throw MalformedContainer("Unexpected end of zip data");
    }
    return static_cast<std::uint16_t>(static_cast<unsigned char>(data[offset]) |
                                      (static_cast<unsigned char>(data[offset + 1]) << 8));
}

std::uint32_t readU32(std::string_view data, std::size_t offset) {
    if (offset + 4 > data.size()) {
        throw MalformedContainer("Unexpected end of zip data");
    }
    return static_cast<std::uint32_t>(readU16(data, offset)) |
           (static_cast<std::uint32_t>(readU16(data, offset + 2)) << 16);
}

std::time_t fromDosTime(std::uint16_t time, std::uint16_t date) {
    std::tm parts{};
    parts.tm_year = ((date >> 9) & 0x7f) + 80;
    parts.tm_mon = ((date >> 5) & 0x0f) - 1;
    parts.tm_mday = date & 0x1f;
    parts.tm_hour = (time >> 11) & 0x1f;
    parts.tm_min = (time >> 5) & 0x3f;
    parts.tm_sec = (time & 0x1f) * 2;
    parts.tm_isdst = -1;
    return std::mktime(&parts);
}

std::string describe(zip_error_t &error) {
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

struct FileCloser {
    void operator()(zip_file_t *file) const { zip_fclose(file); }
};

} // namespace

ZipLimits zipLimitsFor(const ScanSettings &settings) {
    ZipLimits limits;
    limits.maxEntries = settings.maxZipEntries;
    limits.maxEntryBytes = settings.maxInflatedEntryBytes;
    limits.maxTotalBytes = settings.maxInflatedTotalBytes;
    return limits;
}

ZipReader::ZipReader(std::string_view archive, ZipLimits limits) : archive(archive), limits(limits) {}

ZipReader ZipReader::open(std::string_view archive, ZipLimits limits) {
    ZipReader reader(archive, limits);
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t *source = zip_source_buffer_create(archive.data(), archive.size(), 0, &error);
    if (source == nullptr) {
        throw MalformedContainer("Cannot wrap archive: " + describe(error));
    }
    zip_t *opened = zip_open_from_source(source, ZIP_RDONLY, &error);
    if (opened == nullptr) {
        zip_source_free(source);
        throw MalformedContainer("Not a readable zip archive: " + describe(error));
    }
    zip_error_fini(&error);
    reader.handle.reset(opened);

    const auto count = zip_get_num_entries(opened, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        if (reader.entryList.size() >= limits.maxEntries) {
            reader.entryCapReached = true;
            break;
        }
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(opened, static_cast<zip_uint64_t>(i), 0, &stat) != 0 || (stat.valid & ZIP_STAT_NAME) == 0) {
            throw MalformedContainer("Cannot stat zip member " + std::to_string(i) + ": " + zip_strerror(opened));
        }
        ZipEntry entry;
        entry.name = stat.name;
        entry.index = stat.index;
        entry.method = static_cast<std::uint16_t>(stat.comp_method);
        entry.crc32 = stat.crc;
        entry.compressedSize = stat.comp_size;
        entry.uncompressedSize = stat.size;
        entry.modified = stat.mtime;
        reader.entryList.push_back(std::move(entry));
    }
    return reader;
}

ZipReader ZipReader::salvage(std::string_view archive, ZipLimits limits) {
    ZipReader reader(archive, limits);
    std::size_t cursor = 0;
    while (cursor + kLocalHeaderSize <= archive.size() && readU32(archive, cursor) == kLocalHeaderSignature) {
        ScanDeadline::check("zip salvage");
        if (reader.entryList.size() >= limits.maxEntries) {
            reader.entryCapReached = true;
            break;
        }
        ZipEntry entry;
        entry.index = reader.entryList.size();
        entry.flags = readU16(archive, cursor + 6);
        entry.method = readU16(archive, cursor + 8);
        entry.modified = fromDosTime(readU16(archive, cursor + 10), readU16(archive, cursor + 12));
        entry.crc32 = readU32(archive, cursor + 14);
        entry.compressedSize = readU32(archive, cursor + 18);
        entry.uncompressedSize = readU32(archive, cursor + 22);
        const auto nameLength = readU16(archive, cursor + 26);
        const auto extraLength = readU16(archive, cursor + 28);
        if (cursor + kLocalHeaderSize + nameLength > archive.size()) {
            throw MalformedContainer("Local header name out of range");
        }
        entry.name = std::string(archive.substr(cursor + kLocalHeaderSize, nameLength));
        entry.dataOffset = cursor + kLocalHeaderSize + nameLength + extraLength;
        if (entry.dataOffset > archive.size()) {
            throw MalformedContainer("Local header for " + entry.name + " is truncated");
        }

        std::size_t next = 0;
        if ((entry.flags & kDataDescriptorFlag) != 0) {
            if (entry.method != ZipWriter::kDeflated) {
                throw MalformedContainer("Stored member " + entry.name + " uses a data descriptor");
            }
            std::size_t consumed = 0;
            const auto dataStart = static_cast<std::size_t>(entry.dataOffset);
            const auto inflated = compression::inflateRaw(archive.data() + dataStart, archive.size() - dataStart,
                                                          limits.maxEntryBytes, &consumed);
            entry.compressedSize = consumed;
            entry.uncompressedSize = inflated.size();
            entry.crc32 = compression::crc32(inflated);
            next = dataStart + consumed;
            if (next + 4 <= archive.size() && readU32(archive, next) == kDataDescriptorSignature) {
                next += 16;
            } else {
                next += 12;
            }
        } else {
            next = static_cast<std::size_t>(entry.dataOffset + entry.compressedSize);
        }
        if (entry.dataOffset + entry.compressedSize > archive.size()) {
            throw MalformedContainer("Member data for " + entry.name + " is truncated");
        }
        reader.entryList.push_back(std::move(entry));
        cursor = next;
    }
    if (reader.entryList.empty()) {
        throw MalformedContainer("No local file headers found");
    }
    return reader;
}

const ZipEntry *ZipReader::find(const std::string &name) const {
    const auto it = std::find_if(entryList.begin(), entryList.end(),
                                 [&](const ZipEntry &entry) { return entry.name == name; });
    return it == entryList.end() ? nullptr : &*it;
}

std::uint64_t ZipReader::remainingBudget() const {
    const auto total = limits.maxTotalBytes > inflatedTotal ? limits.maxTotalBytes - inflatedTotal : 0;
    return std::min<std::uint64_t>(limits.maxEntryBytes, total);
}

std::string ZipReader::read(const ZipEntry &entry) {
    if (entry.uncompressedSize > limits.maxEntryBytes) {
        throw ResourceLimitExceeded("Member " + entry.name + " exceeds the per-entry size limit");
    }
    auto data = handle ? readIndexed(entry, remainingBudget()) : readSalvaged(entry, remainingBudget());
    inflatedTotal += data.size();
    return data;
}

// libzip verifies the CRC once the member has been read to the end.
std::string ZipReader::readIndexed(const ZipEntry &entry, std::uint64_t budget) {
    std::unique_ptr<zip_file_t, FileCloser> file(zip_fopen_index(handle.get(), entry.index, 0));
    if (!file) {
        throw MalformedContainer("Cannot open member " + entry.name + ": " + zip_strerror(handle.get()));
    }
    std::string data;
    char chunk[kReadChunk];
    for (std::size_t iteration = 0;; ++iteration) {
        ScanDeadline::poll(iteration, "zip read");
        const auto count = zip_fread(file.get(), chunk, sizeof(chunk));
        if (count < 0) {
            throw MalformedContainer("Cannot read member " + entry.name + ": " + zip_file_strerror(file.get()));
        }
        if (count == 0) {
            break;
        }
        if (data.size() + static_cast<std::uint64_t>(count) > budget) {
            throw ResourceLimitExceeded("Member " + entry.name + " exceeds the inflation budget");
        }
        data.append(chunk, static_cast<std::size_t>(count));
    }
    return data;
}

std::string ZipReader::readSalvaged(const ZipEntry &entry, std::uint64_t budget) const {
    const char *start = archive.data() + entry.dataOffset;
    std::string data;
    if (entry.method == ZipWriter::kStored) {
        if (entry.compressedSize > budget) {
            throw ResourceLimitExceeded("Member " + entry.name + " exceeds the inflation budget");
        }
        data.assign(start, static_cast<std::size_t>(entry.compressedSize));
    } else if (entry.method == ZipWriter::kDeflated) {
        data = compression::inflateRaw(start, static_cast<std::size_t>(entry.compressedSize), budget);
    } else {
        throw MalformedContainer("Unsupported compression method " + std::to_string(entry.method) + " for " +
                                 entry.name);
    }
    if (compression::crc32(data) != entry.crc32) {
        throw MalformedContainer("CRC mismatch for " + entry.name);
    }
    return data;
}

ZipWriter::ZipWriter() {
    zip_error_t error;
    zip_error_init(&error);
    source = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (source == nullptr) {
        throw std::runtime_error("Cannot create zip buffer: " + describe(error));
    }
    archive = zip_open_from_source(source, ZIP_TRUNCATE, &error);
    if (archive == nullptr) {
        zip_source_free(source);
        throw std::runtime_error("Cannot create zip archive: " + describe(error));
    }
    zip_error_fini(&error);
    // Keeps the buffer alive after zip_close so finish() can read it back.
    zip_source_keep(source);
}

ZipWriter::~ZipWriter() {
    if (archive != nullptr) {
        zip_discard(archive);
    }
    zip_source_free(source);
}

void ZipWriter::add(const std::string &name, std::string data, std::uint16_t method, std::time_t modified) {
    if (archive == nullptr) {
        throw std::logic_error("ZipWriter already finished");
    }
    payloads.push_back(std::move(data));
    const auto &payload = payloads.back();
    zip_source_t *member = zip_source_buffer(archive, payload.data(), payload.size(), 0);
    if (member == nullptr) {
        throw std::runtime_error("Cannot buffer member " + name + ": " + zip_strerror(archive));
    }
    const auto index = zip_file_add(archive, name.c_str(), member, ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        zip_source_free(member);
        throw std::runtime_error("Cannot add member " + name + ": " + zip_strerror(archive));
    }
    const auto placed = static_cast<zip_uint64_t>(index);
    const zip_int32_t compression = method == kStored ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    if (zip_set_file_compression(archive, placed, compression, 0) != 0 ||
        zip_file_set_mtime(archive, placed, modified == 0 ? kFixedModified : modified, 0) != 0) {
        throw std::runtime_error("Cannot configure member " + name + ": " + zip_strerror(archive));
    }
    ++memberCount;
}

std::string ZipWriter::finish() {
    if (archive == nullptr) {
        throw std::logic_error("ZipWriter already finished");
    }
    if (zip_close(archive) != 0) {
        throw std::runtime_error(std::string("Cannot write zip archive: ") + zip_strerror(archive));
    }
    archive = nullptr;

    if (zip_source_open(source) != 0) {
        throw std::runtime_error("Cannot reopen zip buffer");
    }
    zip_source_seek(source, 0, SEEK_END);
    const auto length = zip_source_tell(source);
    zip_source_seek(source, 0, SEEK_SET);
    std::string out(length > 0 ? static_cast<std::size_t>(length) : 0, '\0');
    const auto copied = out.empty() ? 0 : zip_source_read(source, &out[0], out.size());
    zip_source_close(source);
    if (length < 0 || copied != length) {
        throw std::runtime_error("Cannot read back zip buffer");
    }
    return out;
}

bool looksLikeZip(const std::string &bytes) {
    return bytes.size() >= 4 && bytes.compare(0, 4, "PK\x03\x04", 4) == 0;
}

} // namespace docshield
