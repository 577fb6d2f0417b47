#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docshield::pdf {

// Deepest array/dictionary nesting parsed, analysed and cleaned.
constexpr int kMaxNesting = 128;

enum class ObjectType { Null, Boolean, Number, String, Name, Array, Dictionary, Reference };

struct DictEntry;

struct Object {
    ObjectType type{ObjectType::Null};
    bool boolean{false};
    // Number token as written, decoded string bytes, or decoded name without '/'.
    std::string text;
    std::vector<Object> items;
    std::vector<DictEntry> entries;
    int refNumber{0};
    int refGeneration{0};
    // Byte span in the buffer the object was parsed from.
    std::size_t begin{0};
    std::size_t end{0};

    bool isName(const std::string &name) const;
    bool isDictionary() const { return type == ObjectType::Dictionary; }
    const Object *get(const std::string &key) const;
    bool has(const std::string &key) const { return get(key) != nullptr; }
    const DictEntry *entry(const std::string &key) const;
    long long asInteger(long long fallback = 0) const;
};

struct DictEntry {
    std::string key;
    std::size_t keyBegin{0};
    Object value;
};

struct IndirectObject {
    int number{0};
    int generation{0};
    Object value;
    bool hasStream{false};
    std::size_t offset{0};
    std::size_t endOffset{0};
    std::size_t streamBegin{0};
    std::size_t streamEnd{0};
    bool inObjectStream{false};
    int containerNumber{0};
};

// Object graph recovered by scanning "N G obj" headers; the cross-reference
// table is not trusted. The source buffer must outlive the document.
class Document {
  public:
    // Throws MalformedContainer when no objects or no catalog can be found.
    // maxObjects bounds the object walk; the trailer, the catalog and the
    // objects its actions reference are still located past the cap.
    static Document parse(std::string_view source, std::size_t maxObjects);

    const std::vector<IndirectObject> &objects() const { return objectList; }
    const IndirectObject *find(int number) const;
    // Follows indirect references; null when dangling or cyclic.
    const Object *resolve(const Object *object) const;
    const Object &trailer() const { return trailerDict; }
    const Object *catalog() const;
    const IndirectObject *catalogObject() const;

    bool truncated() const { return objectCapReached; }
    bool encrypted() const { return trailerDict.has("Encrypt"); }
    std::size_t skippedObjects() const { return skipped; }
    std::size_t pageCount() const;
    const std::vector<std::string> &diagnostics() const { return notes; }

    std::string rawStream(const IndirectObject &object) const;
    // Applies /FlateDecode filters. Throws MalformedContainer for filters it
    // cannot decode.
    std::string decodedStream(const IndirectObject &object, std::uint64_t maxOutput) const;

  private:
    void scanObjects(std::size_t maxObjects);
    bool readObject(std::size_t at, int number, int generation, std::size_t start, IndirectObject &object,
                    std::size_t &next);
    void loadBeyondCap(const std::set<int> &wanted);
    void loadCatalogClosure();
    void readCrossReferenceStream();
    void locateTrailer();
    void expandObjectStreams(std::size_t maxObjects);

    std::string_view source;
    std::vector<IndirectObject> objectList;
    std::map<int, std::size_t> index;
    Object trailerDict;
    int catalogNumber{0};
    bool objectCapReached{false};
    std::size_t capOffset{std::string_view::npos};
    std::size_t skipped{0};
    std::vector<std::string> notes;
};

bool isWhitespace(char ch);
bool isDelimiter(char ch);

} // namespace docshield::pdf
