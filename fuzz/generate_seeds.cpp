// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <collab-text/codec.hpp>
#include <collab-text/replica.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: empty patch
    write_seed(dir + "/seed_empty.bin", collab_text::encode_patch({}));

    // Seed 2: single insert
    {
        auto r = collab_text::Replica{1};
        write_seed(dir + "/seed_insert.bin", collab_text::encode_patch(r.splice(0, 0, "hello").patch));
    }

    // Seed 3: replacement (remove + insert in one part)
    {
        auto r = collab_text::Replica{1};
        r.splice(0, 0, "hello world");
        write_seed(dir + "/seed_replace.bin", collab_text::encode_patch(r.splice(6, 5, "there").patch));
    }

    // Seed 4: several parts in one update
    {
        auto r = collab_text::Replica{1};
        auto result = r.splice({collab_text::Splice{.index = 0, .remove = 0, .text = "abc"},
                                collab_text::Splice{.index = 1, .remove = 1, .text = "de"}});
        write_seed(dir + "/seed_multi_part.bin", collab_text::encode_patch(result.patch));
    }

    // Seed 5: deflated frame
    {
        auto r = collab_text::Replica{1};
        write_seed(dir + "/seed_deflated.bin",
                   collab_text::encode_patch(r.splice(0, 0, std::string(512, 'x')).patch));
    }

    return 0;
}
