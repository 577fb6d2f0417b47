#include "DocShield/PdfDocument.hpp"

#include "DocShield/Compression.hpp"
#include "DocShield/ScanDeadline.hpp"
#include "DocShield/ScanTypes.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace docshield::pdf {

namespace {

constexpr int kMaxReferenceHops = 32;
constexpr std::uint64_t kObjectStreamLimit = 16ull * 1024 * 1024;
// Objects fetched past the object cap to complete the catalog's action graph.
constexpr std::size_t kClosureObjects = 64;
constexpr int kClosureRounds = 4;

bool isRegular(char ch) {
    return !isWhitespace(ch) && !isDelimiter(ch);
}

int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool isIntegerToken(const std::string &token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

// Whole-token decimal parse; false for empty, partial or out-of-range input.
template <typename T>
bool parseDigits(std::string_view text, T &value) {
    if (text.empty()) {
        return false;
    }
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

class Parser {
  public:
    Parser(std::string_view data, std::size_t position) : data(data), position(position) {}

    void skipWhitespace() {
        while (position < data.size()) {
            const char ch = data[position];
            if (isWhitespace(ch)) {
                ++position;
            } else if (ch == '%') {
                while (position < data.size() && data[position] != '\n' && data[position] != '\r') {
                    ++position;
                }
            } else {
                break;
            }
        }
    }

    bool atKeyword(std::string_view keyword) const {
        if (data.substr(position, keyword.size()) != keyword) {
            return false;
        }
        const auto after = position + keyword.size();
        return after >= data.size() || !isRegular(data[after]);
    }

    Object parseObject(int depth = 0) {
        if (depth > kMaxNesting) {
            throw MalformedContainer("PDF objects nested too deeply");
        }
        skipWhitespace();
        if (position >= data.size()) {
            throw MalformedContainer("Unexpected end of PDF data");
        }
        const auto start = position;
        const char ch = data[position];
        Object object;
        if (ch == '/') {
            object.type = ObjectType::Name;
            object.text = readName();
        } else if (ch == '(') {
            object.type = ObjectType::String;
            object.text = readLiteralString();
        } else if (ch == '<' && position + 1 < data.size() && data[position + 1] == '<') {
            object = readDictionary(depth);
        } else if (ch == '<') {
            object.type = ObjectType::String;
            object.text = readHexString();
        } else if (ch == '[') {
            object = readArray(depth);
        } else if (ch == '+' || ch == '-' || ch == '.' || std::isdigit(static_cast<unsigned char>(ch))) {
            object = readNumberOrReference();
        } else {
            const auto token = readToken();
            if (token == "true" || token == "false") {
                object.type = ObjectType::Boolean;
                object.boolean = token == "true";
            } else if (token == "null") {
                object.type = ObjectType::Null;
            } else {
                throw MalformedContainer("Unexpected PDF token '" + token + "' at offset " + std::to_string(start));
            }
        }
        object.begin = start;
        object.end = position;
        return object;
    }

    std::string_view data;
    std::size_t position;

  private:
    std::string readToken() {
        const auto start = position;
        while (position < data.size() && isRegular(data[position])) {
            ++position;
        }
        if (position == start) {
            throw MalformedContainer("Unexpected delimiter at offset " + std::to_string(start));
        }
        return std::string(data.substr(start, position - start));
    }

    std::string readName() {
        ++position;
        std::string name;
        while (position < data.size() && isRegular(data[position])) {
            const char ch = data[position];
            if (ch == '#' && position + 2 < data.size() && hexValue(data[position + 1]) >= 0 &&
                hexValue(data[position + 2]) >= 0) {
                name.push_back(static_cast<char>(hexValue(data[position + 1]) * 16 + hexValue(data[position + 2])));
                position += 3;
            } else {
                name.push_back(ch);
                ++position;
            }
        }
        return name;
    }

    std::string readLiteralString() {
        ++position;
        std::string value;
        int depth = 1;
        while (position < data.size()) {
            const char ch = data[position++];
            if (ch == '\\') {
                if (position >= data.size()) {
                    break;
                }
                const char escaped = data[position++];
                switch (escaped) {
                case 'n': value.push_back('\n'); break;
                case 'r': value.push_back('\r'); break;
                case 't': value.push_back('\t'); break;
                case 'b': value.push_back('\b'); break;
                case 'f': value.push_back('\f'); break;
                case '\r':
                    if (position < data.size() && data[position] == '\n') {
                        ++position;
                    }
                    break;
                case '\n': break;
                default:
                    if (escaped >= '0' && escaped <= '7') {
                        int code = escaped - '0';
                        for (int i = 0; i < 2 && position < data.size() && data[position] >= '0' && data[position] <= '7'; ++i) {
                            code = code * 8 + (data[position++] - '0');
                        }
                        value.push_back(static_cast<char>(code & 0xff));
                    } else {
                        value.push_back(escaped);
                    }
                    break;
                }
            } else if (ch == '(') {
                ++depth;
                value.push_back(ch);
            } else if (ch == ')') {
                if (--depth == 0) {
                    return value;
                }
                value.push_back(ch);
            } else {
                value.push_back(ch);
            }
        }
        throw MalformedContainer("Unterminated PDF string");
    }

    std::string readHexString() {
        ++position;
        std::string value;
        int pending = -1;
        while (position < data.size()) {
            const char ch = data[position++];
            if (ch == '>') {
                if (pending >= 0) {
                    value.push_back(static_cast<char>(pending * 16));
                }
                return value;
            }
            if (isWhitespace(ch)) {
                continue;
            }
            const int nibble = hexValue(ch);
            if (nibble < 0) {
                throw MalformedContainer("Invalid character in PDF hex string");
            }
            if (pending < 0) {
                pending = nibble;
            } else {
                value.push_back(static_cast<char>(pending * 16 + nibble));
                pending = -1;
            }
        }
        throw MalformedContainer("Unterminated PDF hex string");
    }

    Object readDictionary(int depth) {
        position += 2;
        Object object;
        object.type = ObjectType::Dictionary;
        while (true) {
            skipWhitespace();
            if (position + 1 < data.size() && data[position] == '>' && data[position + 1] == '>') {
                position += 2;
                return object;
            }
            if (position >= data.size()) {
                throw MalformedContainer("Unterminated PDF dictionary");
            }
            if (data[position] != '/') {
                throw MalformedContainer("PDF dictionary key is not a name at offset " + std::to_string(position));
            }
            DictEntry entry;
            entry.keyBegin = position;
            entry.key = readName();
            entry.value = parseObject(depth + 1);
            object.entries.push_back(std::move(entry));
        }
    }

    Object readArray(int depth) {
        ++position;
        Object object;
        object.type = ObjectType::Array;
        while (true) {
            skipWhitespace();
            if (position >= data.size()) {
                throw MalformedContainer("Unterminated PDF array");
            }
            if (data[position] == ']') {
                ++position;
                return object;
            }
            object.items.push_back(parseObject(depth + 1));
        }
    }

    Object readNumberOrReference() {
        Object object;
        object.type = ObjectType::Number;
        object.text = readToken();
        if (object.text.find_first_not_of("+-.0123456789") != std::string::npos) {
            throw MalformedContainer("Invalid PDF number '" + object.text + "'");
        }
        if (!isIntegerToken(object.text)) {
            return object;
        }

        const auto saved = position;
        skipWhitespace();
        const auto generationStart = position;
        while (position < data.size() && std::isdigit(static_cast<unsigned char>(data[position]))) {
            ++position;
        }
        if (position > generationStart && position < data.size() && isWhitespace(data[position])) {
            const auto generation = data.substr(generationStart, position - generationStart);
            skipWhitespace();
            int number = 0;
            int generationNumber = 0;
            if (atKeyword("R") && parseDigits(object.text, number) && parseDigits(generation, generationNumber)) {
                ++position;
                object.type = ObjectType::Reference;
                object.refNumber = number;
                object.refGeneration = generationNumber;
                return object;
            }
        }
        position = saved;
        return object;
    }
};

// Matches "<num> <gen> obj" ending at the "obj" keyword found at objPos.
bool matchObjectHeader(std::string_view data, std::size_t objPos, int &number, int &generation, std::size_t &start) {
    const auto after = objPos + 3;
    if (after < data.size() && isRegular(data[after])) {
        return false;
    }
    std::size_t cursor = objPos;
    auto skipSpaceBackward = [&]() {
        std::size_t count = 0;
        while (cursor > 0 && isWhitespace(data[cursor - 1])) {
            --cursor;
            ++count;
        }
        return count;
    };
    auto digitsBackward = [&]() {
        const auto endPos = cursor;
        while (cursor > 0 && std::isdigit(static_cast<unsigned char>(data[cursor - 1])) && endPos - cursor < 10) {
            --cursor;
        }
        return std::string(data.substr(cursor, endPos - cursor));
    };

    if (skipSpaceBackward() == 0) {
        return false;
    }
    const auto generationText = digitsBackward();
    if (generationText.empty() || skipSpaceBackward() == 0) {
        return false;
    }
    const auto numberText = digitsBackward();
    if (numberText.empty()) {
        return false;
    }
    if (cursor > 0 && isRegular(data[cursor - 1])) {
        return false;
    }
    if (!parseDigits(numberText, number) || !parseDigits(generationText, generation)) {
        return false;
    }
    start = cursor;
    return true;
}

std::vector<std::string> filterNames(const Object *filter) {
    std::vector<std::string> names;
    if (filter == nullptr) {
        return names;
    }
    if (filter->type == ObjectType::Name) {
        names.push_back(filter->text);
    } else if (filter->type == ObjectType::Array) {
        for (const auto &item : filter->items) {
            if (item.type != ObjectType::Name) {
                throw MalformedContainer("Stream filter array contains a non-name");
            }
            names.push_back(item.text);
        }
    }
    return names;
}

void collectReferences(const Object &object, std::set<int> &out, int depth) {
    if (depth > kMaxNesting) {
        return;
    }
    if (object.type == ObjectType::Reference) {
        out.insert(object.refNumber);
    }
    for (const auto &item : object.items) {
        collectReferences(item, out, depth + 1);
    }
    for (const auto &entry : object.entries) {
        collectReferences(entry.value, out, depth + 1);
    }
}

} // namespace

bool isWhitespace(char ch) {
    return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\0';
}

bool isDelimiter(char ch) {
    switch (ch) {
    case '(': case ')': case '<': case '>': case '[': case ']': case '{': case '}': case '/': case '%':
        return true;
    default:
        return false;
    }
}

bool Object::isName(const std::string &name) const {
    return type == ObjectType::Name && text == name;
}

const DictEntry *Object::entry(const std::string &key) const {
    if (type != ObjectType::Dictionary) {
        return nullptr;
    }
    // Last occurrence wins for duplicated keys.
    const DictEntry *found = nullptr;
    for (const auto &candidate : entries) {
        if (candidate.key == key) {
            found = &candidate;
        }
    }
    return found;
}

const Object *Object::get(const std::string &key) const {
    const auto *found = entry(key);
    return found == nullptr ? nullptr : &found->value;
}

long long Object::asInteger(long long fallback) const {
    if (type != ObjectType::Number) {
        return fallback;
    }
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    long long value = 0;
    const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return result.ec == std::errc() ? value : fallback;
}

Document Document::parse(std::string_view source, std::size_t maxObjects) {
    Document document;
    document.source = source;
    document.scanObjects(maxObjects);
    if (document.objectList.empty()) {
        throw MalformedContainer("No PDF objects found");
    }
    document.expandObjectStreams(maxObjects);
    document.locateTrailer();
    if (document.catalog() == nullptr) {
        throw MalformedContainer("PDF document catalog not found");
    }
    if (document.objectCapReached) {
        document.loadCatalogClosure();
    }
    return document;
}

void Document::scanObjects(std::size_t maxObjects) {
    std::size_t searchFrom = 0;
    for (std::size_t iteration = 0;; ++iteration) {
        ScanDeadline::poll(iteration, "pdf object scan");
        const auto at = source.find("obj", searchFrom);
        if (at == std::string_view::npos) {
            break;
        }
        int number = 0;
        int generation = 0;
        std::size_t start = 0;
        if (!matchObjectHeader(source, at, number, generation, start)) {
            searchFrom = at + 3;
            continue;
        }
        if (objectList.size() >= maxObjects) {
            objectCapReached = true;
            capOffset = start;
            break;
        }

        IndirectObject object;
        if (!readObject(at, number, generation, start, object, searchFrom)) {
            continue;
        }
        index[number] = objectList.size();
        objectList.push_back(std::move(object));
    }
}

bool Document::readObject(std::size_t at, int number, int generation, std::size_t start, IndirectObject &object,
                          std::size_t &next) {
    object.number = number;
    object.generation = generation;
    object.offset = start;
    Parser parser(source, at + 3);
    try {
        object.value = parser.parseObject();
    } catch (const MalformedContainer &error) {
        ++skipped;
        notes.push_back("Skipped object " + std::to_string(number) + ": " + error.what());
        next = at + 3;
        return false;
    }

    parser.skipWhitespace();
    if (object.value.isDictionary() && parser.atKeyword("stream")) {
        std::size_t dataStart = parser.position + 6;
        if (dataStart < source.size() && source[dataStart] == '\r') {
            ++dataStart;
        }
        if (dataStart < source.size() && source[dataStart] == '\n') {
            ++dataStart;
        }
        std::size_t dataEnd = std::string_view::npos;
        std::size_t streamTail = std::string_view::npos;
        const auto *length = object.value.get("Length");
        if (length != nullptr && length->type == ObjectType::Number) {
            const auto declared = length->asInteger(-1);
            if (declared >= 0 && static_cast<std::uint64_t>(declared) <= source.size() - std::min(dataStart, source.size())) {
                Parser tail(source, dataStart + static_cast<std::size_t>(declared));
                tail.skipWhitespace();
                if (tail.atKeyword("endstream")) {
                    dataEnd = dataStart + static_cast<std::size_t>(declared);
                    streamTail = tail.position;
                }
            }
        }
        if (dataEnd == std::string_view::npos) {
            streamTail = source.find("endstream", dataStart);
            if (streamTail == std::string_view::npos) {
                ++skipped;
                notes.push_back("Skipped object " + std::to_string(number) + ": unterminated stream");
                next = dataStart;
                return false;
            }
            dataEnd = streamTail;
            if (dataEnd > dataStart && source[dataEnd - 1] == '\n') {
                --dataEnd;
            }
            if (dataEnd > dataStart && source[dataEnd - 1] == '\r') {
                --dataEnd;
            }
        }
        object.hasStream = true;
        object.streamBegin = dataStart;
        object.streamEnd = dataEnd;
        parser.position = streamTail + 9;
        parser.skipWhitespace();
    }
    if (parser.atKeyword("endobj")) {
        parser.position += 6;
    }
    object.endOffset = parser.position;
    next = parser.position;
    return true;
}

void Document::loadBeyondCap(const std::set<int> &wanted) {
    if (capOffset == std::string_view::npos || wanted.empty()) {
        return;
    }
    // Later definitions win, as they do for incremental updates.
    std::map<int, IndirectObject> found;
    std::size_t searchFrom = capOffset;
    for (std::size_t iteration = 0;; ++iteration) {
        ScanDeadline::poll(iteration, "pdf catalog lookup");
        const auto at = source.find("obj", searchFrom);
        if (at == std::string_view::npos) {
            break;
        }
        int number = 0;
        int generation = 0;
        std::size_t start = 0;
        if (!matchObjectHeader(source, at, number, generation, start) || wanted.count(number) == 0) {
            searchFrom = at + 3;
            continue;
        }
        IndirectObject object;
        if (readObject(at, number, generation, start, object, searchFrom)) {
            found[number] = std::move(object);
        }
    }
    for (auto &[number, object] : found) {
        index[number] = objectList.size();
        objectList.push_back(std::move(object));
    }
}

void Document::loadCatalogClosure() {
    std::set<int> references;
    const auto *root = catalog();
    for (const auto *key : {"OpenAction", "AA", "Names"}) {
        if (const auto *value = root->get(key)) {
            collectReferences(*value, references, 0);
        }
    }

    std::set<int> searched;
    std::size_t loaded = 0;
    for (int round = 0; round < kClosureRounds && loaded < kClosureObjects; ++round) {
        std::set<int> wanted;
        for (const auto number : references) {
            if (find(number) == nullptr && searched.insert(number).second && loaded + wanted.size() < kClosureObjects) {
                wanted.insert(number);
            }
        }
        if (wanted.empty()) {
            break;
        }
        const auto before = objectList.size();
        loadBeyondCap(wanted);
        loaded += objectList.size() - before;
        references.clear();
        for (auto i = before; i < objectList.size(); ++i) {
            collectReferences(objectList[i].value, references, 0);
        }
    }
    if (loaded > 0) {
        notes.push_back("Loaded " + std::to_string(loaded) + " catalog action object(s) past the object limit");
    }
}

void Document::readCrossReferenceStream() {
    const auto at = source.rfind("startxref");
    if (at == std::string_view::npos) {
        return;
    }
    std::size_t cursor = at + 9;
    while (cursor < source.size() && isWhitespace(source[cursor])) {
        ++cursor;
    }
    const auto digits = cursor;
    while (cursor < source.size() && std::isdigit(static_cast<unsigned char>(source[cursor]))) {
        ++cursor;
    }
    std::size_t offset = 0;
    if (!parseDigits(source.substr(digits, cursor - digits), offset) || offset >= source.size()) {
        return;
    }
    const auto objPos = source.find("obj", offset);
    int number = 0;
    int generation = 0;
    std::size_t start = 0;
    if (objPos == std::string_view::npos || objPos > offset + 32 ||
        !matchObjectHeader(source, objPos, number, generation, start)) {
        return;
    }
    IndirectObject object;
    std::size_t next = 0;
    if (!readObject(objPos, number, generation, start, object, next)) {
        return;
    }
    const auto *type = object.value.get("Type");
    if (type != nullptr && type->isName("XRef")) {
        trailerDict = std::move(object.value);
    }
}

void Document::expandObjectStreams(std::size_t maxObjects) {
    const auto containers = objectList.size();
    for (std::size_t i = 0; i < containers; ++i) {
        ScanDeadline::poll(i, "pdf object streams");
        if (objectList[i].inObjectStream || !objectList[i].hasStream) {
            continue;
        }
        const auto *type = objectList[i].value.get("Type");
        if (type == nullptr || !type->isName("ObjStm")) {
            continue;
        }
        const auto containerNumber = objectList[i].number;
        const auto count = objectList[i].value.get("N") ? objectList[i].value.get("N")->asInteger(0) : 0;
        const auto first = objectList[i].value.get("First") ? objectList[i].value.get("First")->asInteger(-1) : -1;

        std::string decoded;
        try {
            decoded = decodedStream(objectList[i], kObjectStreamLimit);
        } catch (const std::runtime_error &error) {
            ++skipped;
            notes.push_back("Object stream " + std::to_string(containerNumber) + " not decoded: " + error.what());
            continue;
        }
        if (count <= 0 || first < 0 || static_cast<std::size_t>(first) > decoded.size()) {
            ++skipped;
            notes.push_back("Object stream " + std::to_string(containerNumber) + " has an invalid header");
            continue;
        }

        Parser header(decoded, 0);
        std::vector<std::pair<int, std::size_t>> members;
        try {
            for (long long n = 0; n < count; ++n) {
                const auto numberObject = header.parseObject();
                const auto offsetObject = header.parseObject();
                if (numberObject.type != ObjectType::Number || offsetObject.type != ObjectType::Number) {
                    throw MalformedContainer("non-numeric object stream header");
                }
                members.emplace_back(static_cast<int>(numberObject.asInteger()),
                                     static_cast<std::size_t>(first + offsetObject.asInteger()));
            }
        } catch (const MalformedContainer &error) {
            ++skipped;
            notes.push_back("Object stream " + std::to_string(containerNumber) + ": " + error.what());
        }

        for (const auto &[number, offset] : members) {
            if (objectList.size() >= maxObjects) {
                objectCapReached = true;
                return;
            }
            if (offset >= decoded.size()) {
                ++skipped;
                continue;
            }
            IndirectObject object;
            object.number = number;
            object.inObjectStream = true;
            object.containerNumber = containerNumber;
            try {
                Parser parser(decoded, offset);
                object.value = parser.parseObject();
            } catch (const MalformedContainer &error) {
                ++skipped;
                notes.push_back("Skipped object " + std::to_string(number) + " in stream " +
                                std::to_string(containerNumber) + ": " + error.what());
                continue;
            }
            index.emplace(number, objectList.size());
            objectList.push_back(std::move(object));
        }
    }
}

void Document::locateTrailer() {
    const auto at = source.rfind("trailer");
    if (at != std::string_view::npos) {
        try {
            Parser parser(source, at + 7);
            auto candidate = parser.parseObject();
            if (candidate.isDictionary()) {
                trailerDict = std::move(candidate);
            }
        } catch (const MalformedContainer &error) {
            notes.push_back(std::string("Trailer unreadable: ") + error.what());
        }
    }
    if (!trailerDict.isDictionary() && objectCapReached) {
        readCrossReferenceStream();
    }
    if (!trailerDict.isDictionary()) {
        // Cross-reference streams carry the trailer keys in their dictionary.
        for (auto it = objectList.rbegin(); it != objectList.rend(); ++it) {
            const auto *type = it->value.get("Type");
            if (type != nullptr && type->isName("XRef")) {
                trailerDict = it->value;
                break;
            }
        }
    }

    const auto *root = trailerDict.get("Root");
    if (root != nullptr && root->type == ObjectType::Reference) {
        if (find(root->refNumber) == nullptr && objectCapReached) {
            loadBeyondCap({root->refNumber});
        }
        const auto *target = find(root->refNumber);
        if (target != nullptr && target->value.isDictionary()) {
            catalogNumber = root->refNumber;
            return;
        }
    }
    for (auto it = objectList.rbegin(); it != objectList.rend(); ++it) {
        const auto *type = it->value.get("Type");
        if (type != nullptr && type->isName("Catalog")) {
            catalogNumber = it->number;
            notes.push_back("Catalog located by /Type scan");
            return;
        }
    }
}

const IndirectObject *Document::find(int number) const {
    const auto it = index.find(number);
    return it == index.end() ? nullptr : &objectList[it->second];
}

const Object *Document::resolve(const Object *object) const {
    for (int hops = 0; object != nullptr && object->type == ObjectType::Reference; ++hops) {
        if (hops >= kMaxReferenceHops) {
            return nullptr;
        }
        const auto *target = find(object->refNumber);
        object = target == nullptr ? nullptr : &target->value;
    }
    return object;
}

const IndirectObject *Document::catalogObject() const {
    return catalogNumber == 0 ? nullptr : find(catalogNumber);
}

const Object *Document::catalog() const {
    const auto *object = catalogObject();
    return object == nullptr ? nullptr : &object->value;
}

std::size_t Document::pageCount() const {
    return static_cast<std::size_t>(std::count_if(objectList.begin(), objectList.end(), [](const IndirectObject &object) {
        const auto *type = object.value.get("Type");
        return type != nullptr && type->isName("Page");
    }));
}

std::string Document::rawStream(const IndirectObject &object) const {
    if (!object.hasStream) {
        return {};
    }
    return std::string(source.substr(object.streamBegin, object.streamEnd - object.streamBegin));
}

std::string Document::decodedStream(const IndirectObject &object, std::uint64_t maxOutput) const {
    auto data = rawStream(object);
    const auto filters = filterNames(object.value.get("Filter"));
    const auto *parms = object.value.get("DecodeParms");
    if (parms != nullptr && parms->isDictionary() && parms->get("Predictor") != nullptr &&
        parms->get("Predictor")->asInteger(1) > 1) {
        throw MalformedContainer("Stream predictors are not supported");
    }
    for (const auto &filter : filters) {
        if (filter == "FlateDecode" || filter == "Fl") {
            data = compression::inflateZlib(data, maxOutput);
        } else {
            throw MalformedContainer("Unsupported stream filter /" + filter);
        }
    }
    return data;
}

} // namespace docshield::pdf
