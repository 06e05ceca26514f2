// Based off of StandaloneFuzzTargetMain.c in libFuzzer. Replays corpus files when libFuzzer is not available.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t *data, std::size_t size);

auto main(int argc, char **argv) -> int
{
    std::fprintf(stderr, "main: running %d inputs\n", argc - 1);

    for (int i {1}; i < argc; ++i) {
        std::fprintf(stderr, "Running: %s\n", argv[i]);
        auto *fp = std::fopen(argv[i], "rb");
        if (fp == nullptr) {
            std::fprintf(stderr, "error: cannot open %s\n", argv[i]);
            return EXIT_FAILURE;
        }

        std::string buffer;
        char chunk[0x1000];
        for (std::size_t n; (n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0; )
            buffer.append(chunk, n);
        const auto failed = std::ferror(fp) != 0;
        std::fclose(fp);
        if (failed) {
            std::fprintf(stderr, "error: cannot read %s\n", argv[i]);
            return EXIT_FAILURE;
        }

        const auto *data = reinterpret_cast<const std::uint8_t *>(buffer.data());
        LLVMFuzzerTestOneInput(data, buffer.size());
        std::fprintf(stderr, "Done:    %s: (%zu bytes)\n", argv[i], buffer.size());
    }
    return EXIT_SUCCESS;
}
