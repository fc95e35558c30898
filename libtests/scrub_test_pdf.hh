#ifndef SCRUB_TEST_PDF_HH
#define SCRUB_TEST_PDF_HH

// Builds small PDF files in memory. Cross-reference offsets are taken from the bytes actually
// written, so a test can add revisions, damage the result, or append data and still know exactly
// where everything is.

#include <cstdio>
#include <map>
#include <set>
#include <string>

class TestPDF
{
  public:
    TestPDF(std::string const& version = "1.7") :
        data("%PDF-" + version + "\n%\xbf\xf7\xa2\xfe\n")
    {
    }

    // Add "id 0 obj" with the given body to the current revision.
    void
    object(int id, std::string const& body)
    {
        pending[id] = data.size();
        freed.erase(id);
        data += std::to_string(id) + " 0 obj\n" + body + "\nendobj\n";
        if (id > max_id) {
            max_id = id;
        }
    }

    // Add a stream object. `entries` are extra dictionary entries; /Length is written from the
    // data unless `length` is given.
    void
    stream(int id, std::string const& entries, std::string const& contents, long long length = -1)
    {
        auto n = (length < 0) ? static_cast<long long>(contents.size()) : length;
        object(
            id,
            "<< " + entries + " /Length " + std::to_string(n) + " >>\nstream\n" + contents +
                "\nendstream");
    }

    // Mark an object as deleted in the current revision.
    void
    remove(int id)
    {
        pending.erase(id);
        freed.insert(id);
    }

    // Write the cross-reference table for everything added since the previous revision, then
    // the trailer, startxref and %%EOF. Returns the offset of the table.
    size_t
    finishRevision(std::string const& trailer_entries = "/Root 1 0 R")
    {
        auto xref = data.size();
        data += "xref\n";
        if (last_xref == 0) {
            data += "0 1\n0000000000 65535 f \n";
        }
        std::map<int, std::string> entries;
        for (auto const& [id, offset]: pending) {
            entries[id] = entry(offset, 0, 'n');
        }
        for (auto id: freed) {
            entries[id] = entry(0, 1, 'f');
        }
        // Contiguous runs become subsections.
        auto it = entries.begin();
        while (it != entries.end()) {
            auto first = it->first;
            std::string lines;
            int count = 0;
            while (it != entries.end() && it->first == first + count) {
                lines += it->second;
                ++count;
                ++it;
            }
            data += std::to_string(first) + " " + std::to_string(count) + "\n" + lines;
        }
        data += "trailer\n<< /Size " + std::to_string(max_id + 1) + " " + trailer_entries;
        if (last_xref) {
            data += " /Prev " + std::to_string(last_xref);
        }
        data += " >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
        pending.clear();
        freed.clear();
        last_xref = xref;
        return xref;
    }

    void
    append(std::string const& bytes)
    {
        data += bytes;
    }

    std::string const&
    str() const
    {
        return data;
    }

    std::string&
    str()
    {
        return data;
    }

    size_t
    size() const
    {
        return data.size();
    }

  private:
    static std::string
    entry(size_t offset, int gen, char type)
    {
        char buf[21];
        snprintf(buf, sizeof(buf), "%010zu %05d %c \n", offset, gen, type);
        return buf;
    }

    std::string data;
    std::map<int, size_t> pending;
    std::set<int> freed;
    size_t last_xref{0};
    int max_id{0};
};

// A catalog, a page tree and one page whose content is `content`, in objects 1 through 4.
inline void
add_one_page(TestPDF& pdf, std::string const& content, std::string const& page_extra = "")
{
    pdf.object(1, "<< /Type /Catalog /Pages 2 0 R >>");
    pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    pdf.object(
        3,
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R" +
            (page_extra.empty() ? "" : " " + page_extra) + " >>");
    pdf.stream(4, "", content);
}

// Bytes that contain no '%', so they can't look like an end-of-file marker.
inline std::string
binary_block(size_t n, unsigned seed = 11)
{
    std::string result;
    for (size_t i = 0; i < n; ++i) {
        auto ch = static_cast<unsigned char>((i * 37 + seed) % 256);
        if (ch == '%') {
            ch = 0xa5;
        }
        result += static_cast<char>(ch);
    }
    return result;
}

#endif // SCRUB_TEST_PDF_HH
