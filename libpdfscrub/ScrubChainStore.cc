#include <pdfscrub/ScrubChainStore.hh>

#include <pdfscrub/Pl_SHA2.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <filesystem>
#include <map>
#include <mutex>

namespace
{
    class MemoryChainStore final: public ScrubChainStore
    {
      public:
        ~MemoryChainStore() final = default;

        std::vector<ScrubVerificationRecord>
        load(std::string const& lineage) final
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = chains.find(lineage);
            return it == chains.end() ? std::vector<ScrubVerificationRecord>() : it->second;
        }

        void
        append(std::string const& lineage, ScrubVerificationRecord const& record) final
        {
            std::lock_guard<std::mutex> lock(mutex);
            chains[lineage].emplace_back(record);
        }

      private:
        std::mutex mutex;
        std::map<std::string, std::vector<ScrubVerificationRecord>> chains;
    };

    class DirectoryChainStore final: public ScrubChainStore
    {
      public:
        DirectoryChainStore(std::string const& path) :
            path(path)
        {
            std::filesystem::create_directories(path);
        }
        ~DirectoryChainStore() final = default;

        std::vector<ScrubVerificationRecord>
        load(std::string const& lineage) final
        {
            std::vector<ScrubVerificationRecord> result;
            auto filename = filenameFor(lineage);
            if (!ScrubUtil::file_can_be_opened(filename.c_str())) {
                return result;
            }
            auto data = ScrubUtil::read_file_into_string(filename.c_str());
            size_t line_no = 0;
            size_t pos = 0;
            while (pos < data.size()) {
                auto eol = data.find('\n', pos);
                if (eol == std::string::npos) {
                    eol = data.size();
                }
                ++line_no;
                auto line = data.substr(pos, eol - pos);
                pos = eol + 1;
                if (line.empty()) {
                    continue;
                }
                try {
                    result.emplace_back(ScrubVerificationRecord::fromJSON(JSON::parse(line)));
                } catch (std::runtime_error& e) {
                    throw std::runtime_error(
                        filename + ":" + std::to_string(line_no) + ": " + e.what());
                }
            }
            return result;
        }

        void
        append(std::string const& lineage, ScrubVerificationRecord const& record) final
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto filename = filenameFor(lineage);
            auto line = record.getJSON().unparseCompact() + "\n";
            FILE* f = ScrubUtil::safe_fopen(filename.c_str(), "ab");
            ScrubUtil::FileCloser fc(f);
            if (fwrite(line.data(), 1, line.size(), f) != line.size()) {
                ScrubUtil::throw_system_error(filename + ": write");
            }
            fc.close();
        }

      private:
        // Lineage keys are arbitrary text. Unsafe characters are replaced, and a digest of the
        // key keeps replaced names apart.
        std::string
        filenameFor(std::string const& lineage) const
        {
            std::string name;
            bool replaced = lineage.empty();
            for (auto ch: lineage) {
                if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                    ch == '.' || ch == '_' || ch == '-') {
                    name += ch;
                } else {
                    name += '_';
                    replaced = true;
                }
            }
            if (replaced) {
                name += "-" + Pl_SHA2::hexDigest(lineage).substr(0, 12);
            }
            return (std::filesystem::path(path) / (name + ".jsonl")).string();
        }

        std::string path;
        std::mutex mutex;
    };
} // namespace

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubChainStore::~ScrubChainStore() = default;

std::string
ScrubChainStore::lastLink(std::string const& lineage)
{
    auto records = load(lineage);
    return records.empty() ? std::string() : records.back().chain_link;
}

std::shared_ptr<ScrubChainStore>
ScrubChainStore::memory()
{
    return std::make_shared<MemoryChainStore>();
}

std::shared_ptr<ScrubChainStore>
ScrubChainStore::directory(std::string const& path)
{
    return std::make_shared<DirectoryChainStore>(path);
}

long long
ScrubChainStore::verifyChain(std::vector<ScrubVerificationRecord> const& records)
{
    std::string previous;
    for (size_t i = 0; i < records.size(); ++i) {
        auto const& r = records.at(i);
        if (r.previous_link != previous || r.computeLink() != r.chain_link) {
            return static_cast<long long>(i);
        }
        previous = r.chain_link;
    }
    return -1;
}
