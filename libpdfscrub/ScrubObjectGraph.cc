#include <pdfscrub/ScrubObjectGraph_private.hh>

#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

#include <algorithm>
#include <stdexcept>

using namespace pdfscrub;

ScrubObjectGraph::ScrubObjectGraph() :
    m(std::make_unique<Members>())
{
    m->trailer = ScrubObject::newDictionary();
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubObjectGraph::~ScrubObjectGraph() = default;

void
ScrubObjectGraph::setMaxDecodedSize(unsigned long long size)
{
    m->max_decoded_size = size;
}

std::string const&
ScrubObjectGraph::getFilename() const
{
    return m->filename;
}

std::string const&
ScrubObjectGraph::getPDFVersion() const
{
    return m->pdf_version;
}

scrub_offset_t
ScrubObjectGraph::getInputSize() const
{
    return m->input_size;
}

std::vector<ScrubExc> const&
ScrubObjectGraph::getWarnings() const
{
    return m->warnings;
}

void
ScrubObjectGraph::warn(ScrubExc const& e)
{
    m->warnings.emplace_back(e);
}

bool
ScrubObjectGraph::isRecovered() const
{
    return m->recovered;
}

bool
ScrubObjectGraph::isEncrypted() const
{
    return m->encrypted;
}

bool
ScrubObjectGraph::hasObject(ScrubObjGen og) const
{
    return m->objects.contains(og);
}

ScrubObject
ScrubObjectGraph::getObject(ScrubObjGen og) const
{
    auto it = m->objects.find(og);
    if (it == m->objects.end()) {
        return ScrubObject::newNull();
    }
    return it->second.value;
}

std::shared_ptr<ScrubStream>
ScrubObjectGraph::getStream(ScrubObjGen og) const
{
    auto it = m->objects.find(og);
    if (it == m->objects.end()) {
        return nullptr;
    }
    return it->second.stream;
}

scrub_offset_t
ScrubObjectGraph::getObjectOffset(ScrubObjGen og) const
{
    auto it = m->objects.find(og);
    return it == m->objects.end() ? 0 : it->second.offset;
}

std::vector<ScrubObjGen>
ScrubObjectGraph::getObjectKeys() const
{
    std::vector<ScrubObjGen> result;
    result.reserve(m->objects.size());
    for (auto const& iter: m->objects) {
        result.emplace_back(iter.first);
    }
    return result;
}

size_t
ScrubObjectGraph::getObjectCount() const
{
    return m->objects.size();
}

ScrubObject
ScrubObjectGraph::resolve(ScrubObject obj) const
{
    // An indirect object whose body is itself a reference is unusual but legal; bound the chain.
    for (int i = 0; i < 20 && obj.isReference(); ++i) {
        obj = getObject(obj.getObjGen());
    }
    return obj.isReference() ? ScrubObject::newNull() : obj;
}

std::shared_ptr<ScrubStream>
ScrubObjectGraph::resolveStream(ScrubObject obj) const
{
    return obj.isReference() ? getStream(obj.getObjGen()) : nullptr;
}

void
ScrubObjectGraph::replaceObject(
    ScrubObjGen og, ScrubObject value, std::shared_ptr<ScrubStream> stream)
{
    if (!og.isIndirect()) {
        throw std::logic_error("ScrubObjectGraph::replaceObject called with object 0");
    }
    if (stream) {
        value = stream->getDict();
    }
    auto& body = m->objects[og];
    body.og = og;
    body.value = value;
    body.stream = stream;
}

ScrubObjGen
ScrubObjectGraph::addObject(ScrubObject value, std::shared_ptr<ScrubStream> stream)
{
    int next = m->objects.empty() ? 1 : m->objects.rbegin()->first.getObj() + 1;
    ScrubObjGen og(next, 0);
    replaceObject(og, value, stream);
    return og;
}

bool
ScrubObjectGraph::removeObject(ScrubObjGen og)
{
    if (m->objects.erase(og) == 0) {
        return false;
    }
    auto fn = [og](ScrubObjGen target) {
        return target == og ? ScrubObject::newNull() : ScrubObject();
    };
    for (auto& iter: m->objects) {
        iter.second.value.rewriteReferences(fn);
    }
    m->trailer.rewriteReferences(fn);
    clearMalformed(og);
    return true;
}

ScrubObject
ScrubObjectGraph::getTrailer() const
{
    return m->trailer;
}

void
ScrubObjectGraph::setTrailer(ScrubObject trailer)
{
    if (!trailer.isDictionary()) {
        throw std::logic_error("ScrubObjectGraph::setTrailer called with a non-dictionary");
    }
    m->trailer = trailer;
}

ScrubObject
ScrubObjectGraph::getRoot() const
{
    return resolve(m->trailer.getKey("/Root"));
}

std::vector<ScrubObjGen>
ScrubObjectGraph::getPages() const
{
    std::vector<ScrubObjGen> result;
    ScrubObjGen::set seen;
    auto pages = getRoot().getKey("/Pages");
    if (!pages.isReference()) {
        return result;
    }
    // Depth-first, keeping kids in order
    std::vector<ScrubObjGen> stack{pages.getObjGen()};
    while (!stack.empty()) {
        auto og = stack.back();
        stack.pop_back();
        if (!seen.add(og)) {
            continue;
        }
        auto node = getObject(og);
        if (!node.isDictionary()) {
            continue;
        }
        auto kids = node.getKey("/Kids");
        if (kids.isArray() && !node.isDictionaryOfType("/Page")) {
            for (int i = kids.getArrayNItems(); i > 0; --i) {
                auto kid = kids.getArrayItem(i - 1);
                if (kid.isReference()) {
                    stack.emplace_back(kid.getObjGen());
                }
            }
        } else {
            result.emplace_back(og);
        }
    }
    return result;
}

std::vector<ScrubObjectGraph::Revision> const&
ScrubObjectGraph::getRevisions() const
{
    return m->revisions;
}

std::vector<ScrubObjectGraph::Body> const&
ScrubObjectGraph::getSupersededBodies() const
{
    return m->superseded;
}

std::vector<ScrubObjectGraph::Body> const&
ScrubObjectGraph::getUnindexedBodies() const
{
    return m->unindexed;
}

size_t
ScrubObjectGraph::dropBodies(ScrubObjGen og)
{
    auto match = [og](Body const& b) { return b.og == og; };
    return std::erase_if(m->superseded, match) + std::erase_if(m->unindexed, match);
}

void
ScrubObjectGraph::collapseRevisions()
{
    m->superseded.clear();
    Revision current;
    if (!m->revisions.empty()) {
        current = m->revisions.back();
    }
    current.start = 0;
    current.trailer = m->trailer;
    current.freed.clear();
    m->revisions.clear();
    m->revisions.emplace_back(current);
    for (auto& iter: m->objects) {
        iter.second.revision = 0;
    }
}

void
ScrubObjectGraph::reachableFrom(
    ScrubObject start,
    ScrubObjGen::set& seen,
    std::function<ScrubObject(ScrubObjGen)> lookup) const
{
    std::set<ScrubObjGen> refs;
    start.collectReferences(refs);
    std::vector<ScrubObjGen> queue(refs.begin(), refs.end());
    while (!queue.empty()) {
        auto og = queue.back();
        queue.pop_back();
        if (!seen.add(og)) {
            continue;
        }
        auto obj = lookup(og);
        if (obj.isInitialized()) {
            refs.clear();
            obj.collectReferences(refs);
            queue.insert(queue.end(), refs.begin(), refs.end());
        }
    }
}

ScrubObjGen::set
ScrubObjectGraph::reachable() const
{
    ScrubObjGen::set result;
    reachableFrom(m->trailer, result, [this](ScrubObjGen og) {
        auto it = m->objects.find(og);
        return it == m->objects.end() ? ScrubObject() : it->second.value;
    });
    return result;
}

ScrubObjGen::set
ScrubObjectGraph::reachableFromRevision(size_t revision) const
{
    ScrubObjGen::set result;
    if (revision >= m->revisions.size()) {
        return result;
    }
    auto rev = static_cast<int>(revision);

    // The body each key had as of this revision: the one from the newest revision not after it,
    // unless a later revision up to this one freed the key.
    std::map<ScrubObjGen, Body const*> view;
    auto consider = [&view, rev](Body const& b) {
        if (b.revision < 0 || b.revision > rev) {
            return;
        }
        auto& cur = view[b.og];
        if (cur == nullptr || cur->revision < b.revision) {
            cur = &b;
        }
    };
    for (auto const& iter: m->objects) {
        consider(iter.second);
    }
    for (auto const& b: m->superseded) {
        consider(b);
    }
    for (int r = 0; r <= rev; ++r) {
        for (auto const& og: m->revisions.at(static_cast<size_t>(r)).freed) {
            auto it = view.find(og);
            if (it != view.end() && it->second->revision < r) {
                view.erase(it);
            }
        }
    }

    reachableFrom(m->revisions.at(revision).trailer, result, [&view](ScrubObjGen og) {
        auto it = view.find(og);
        return it == view.end() ? ScrubObject() : it->second->value;
    });
    return result;
}

std::vector<ScrubObjectGraph::Dangling>
ScrubObjectGraph::dangling() const
{
    std::vector<Dangling> result;
    auto check = [this, &result](ScrubObjGen referrer, ScrubObject const& obj) {
        std::set<ScrubObjGen> refs;
        obj.collectReferences(refs);
        for (auto const& target: refs) {
            if (!hasObject(target)) {
                result.push_back({referrer, target});
            }
        }
    };
    check(ScrubObjGen(), m->trailer);
    for (auto const& iter: m->objects) {
        check(iter.first, iter.second.value);
    }
    return result;
}

std::vector<ScrubObjectGraph::Malformed> const&
ScrubObjectGraph::getMalformed() const
{
    return m->malformed;
}

void
ScrubObjectGraph::clearMalformed(ScrubObjGen og)
{
    std::erase_if(m->malformed, [og](Malformed const& mf) { return mf.og == og; });
}

bool
ScrubObjectGraph::hasTrailingData() const
{
    return m->trailing_length > 0;
}

scrub_offset_t
ScrubObjectGraph::getTrailingDataOffset() const
{
    return m->trailing_offset;
}

scrub_offset_t
ScrubObjectGraph::getTrailingDataLength() const
{
    return m->trailing_length;
}

void
ScrubObjectGraph::clearTrailingData()
{
    m->trailing_offset = 0;
    m->trailing_length = 0;
}

std::string const&
ScrubObjectGraph::getContentId() const
{
    return m->content_id;
}

bool
ScrubObjectGraph::findPath(
    ScrubObjGen og,
    std::string const& path,
    ScrubObject& container,
    std::string& last_key,
    int& last_index) const
{
    // Split into "/Key" and "[n]" components.
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < path.size()) {
        if (path.at(i) == '/') {
            auto end = path.find_first_of("/[", i + 1);
            parts.emplace_back(path.substr(i, end == std::string::npos ? end : end - i));
            i = end == std::string::npos ? path.size() : end;
        } else if (path.at(i) == '[') {
            auto end = path.find(']', i);
            if (end == std::string::npos) {
                return false;
            }
            parts.emplace_back(path.substr(i, end + 1 - i));
            i = end + 1;
        } else {
            return false;
        }
    }
    if (parts.empty()) {
        return false;
    }

    auto obj = og.isIndirect() ? getObject(og) : m->trailer;
    for (size_t p = 0; p < parts.size(); ++p) {
        auto const& part = parts.at(p);
        bool last = (p + 1 == parts.size());
        if (part.at(0) == '[') {
            auto idx_str = part.substr(1, part.size() - 2);
            if (idx_str.empty() || !std::all_of(idx_str.begin(), idx_str.end(), util::is_digit) ||
                !obj.isArray()) {
                return false;
            }
            int idx = ScrubUtil::string_to_int(idx_str.c_str());
            if (idx >= obj.getArrayNItems()) {
                return false;
            }
            if (last) {
                container = obj;
                last_key.clear();
                last_index = idx;
                return true;
            }
            obj = obj.getArrayItem(idx);
        } else {
            if (!obj.isDictionary() || !obj.hasKey(part)) {
                return false;
            }
            if (last) {
                container = obj;
                last_key = part;
                last_index = -1;
                return true;
            }
            obj = obj.getKey(part);
        }
    }
    return false;
}

ScrubObject
ScrubObjectGraph::getPath(ScrubObjGen og, std::string const& path) const
{
    if (path.empty()) {
        return og.isIndirect() ? getObject(og) : m->trailer;
    }
    ScrubObject container;
    std::string key;
    int index = -1;
    if (!findPath(og, path, container, key, index)) {
        return ScrubObject::newNull();
    }
    return key.empty() ? container.getArrayItem(index) : container.getKey(key);
}

bool
ScrubObjectGraph::removePath(ScrubObjGen og, std::string const& path)
{
    ScrubObject container;
    std::string key;
    int index = -1;
    if (!findPath(og, path, container, key, index)) {
        return false;
    }
    if (key.empty()) {
        container.eraseItem(index);
    } else {
        container.removeKey(key);
    }
    return true;
}

bool
ScrubObjectGraph::replacePath(ScrubObjGen og, std::string const& path, ScrubObject value)
{
    ScrubObject container;
    std::string key;
    int index = -1;
    if (!findPath(og, path, container, key, index)) {
        return false;
    }
    if (key.empty()) {
        container.setArrayItem(index, value);
    } else {
        container.replaceKey(key, value);
    }
    return true;
}

std::map<ScrubObjGen, ScrubObjGen>
ScrubObjectGraph::compact()
{
    std::map<ScrubObjGen, ScrubObjGen> mapping;
    int next = 1;
    for (auto const& iter: m->objects) {
        mapping[iter.first] = ScrubObjGen(next++, 0);
    }
    auto fn = [&mapping](ScrubObjGen og) {
        auto it = mapping.find(og);
        return (it == mapping.end()) ? ScrubObject() : ScrubObject::newReference(it->second);
    };

    std::map<ScrubObjGen, Body> objects;
    for (auto& [og, body]: m->objects) {
        body.value.rewriteReferences(fn);
        body.og = mapping[og];
        objects[body.og] = body;
    }
    m->objects = std::move(objects);
    m->trailer.rewriteReferences(fn);
    m->trailer.replaceKey("/Size", ScrubObject::newInteger(next));

    m->unindexed.clear();
    for (auto& mf: m->malformed) {
        if (auto it = mapping.find(mf.og); it != mapping.end()) {
            mf.og = it->second;
        }
    }
    collapseRevisions();
    return mapping;
}
