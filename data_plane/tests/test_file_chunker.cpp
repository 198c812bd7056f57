#include "bolster/checksum.hpp"
#include "bolster/errors.hpp"
#include "bolster/file_chunker.hpp"
#include "bolster/local_file.hpp"

#include "test_support.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

int main() {
    namespace fs = std::filesystem;
    using bolster_test::pattern;

    bolster::FileChunker chunker(16);
    assert(chunker.chunk_count(40) == 3);
    auto last = chunker.span_at(40, 2);
    assert(last.index == 2 && last.offset == 32 && last.length == 8);
    auto middle = chunker.span_at(40, 1);
    assert(middle.offset == 16 && middle.length == 16);
    assert(chunker.chunk_count(0) == 0);
    assert(chunker.chunk_count(32) == 2);
    assert(chunker.span_at(32, 1).length == 16);

    // Spans tile [0, size) without gaps for every size and chunk size.
    for (std::size_t chunk_size = 1; chunk_size <= 17; ++chunk_size) {
        bolster::FileChunker planner(chunk_size);
        for (std::uint64_t size = 0; size <= 100; ++size) {
            const std::uint32_t count = planner.chunk_count(size);
            std::uint64_t expected_offset = 0;
            for (std::uint32_t i = 0; i < count; ++i) {
                const auto span = planner.span_at(size, i);
                assert(span.index == i);
                assert(span.offset == expected_offset);
                assert(span.length > 0 && span.length <= chunk_size);
                if (i + 1 < count) {
                    assert(span.length == chunk_size);
                }
                expected_offset += span.length;
            }
            assert(expected_offset == size);
        }
    }

    // Chunk indices are 32-bit.
    bolster::FileChunker tiny(1);
    assert(tiny.chunk_count(0xFFFFFFFFULL) == 0xFFFFFFFFu);
    const auto far = tiny.span_at(0xFFFFFFFFULL, 0xFFFFFFFEu);
    assert(far.offset == 0xFFFFFFFEULL && far.length == 1);
    bool too_many = false;
    try {
        tiny.chunk_count(0x100000000ULL);
    } catch (const std::invalid_argument &) {
        too_many = true;
    }
    assert(too_many);
    too_many = false;
    try {
        bolster::FileChunker(16).chunk_count(1ULL << 40);
    } catch (const std::invalid_argument &) {
        too_many = true;
    }
    assert(too_many);

    bool threw = false;
    try {
        bolster::FileChunker zero(0);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    bolster_test::TempDir temp_dir("chunker");
    auto file_path = temp_dir.path() / "file.bin";
    auto data = pattern(40);
    bolster_test::write_file(file_path, data);

    {
        auto source = bolster::LocalFile::open_for_read(file_path);
        assert(source.size() == 40);
        bolster::ChunkReader reader(source, 40, 16);
        assert(reader.chunk_count() == 3);
        std::vector<char> joined;
        while (reader.has_next()) {
            assert(reader.next_index() == joined.size() / 16);
            auto chunk = reader.next();
            assert(chunk.payload.size() == chunk.length);
            assert(chunk.offset == joined.size());
            joined.insert(joined.end(), chunk.payload.begin(), chunk.payload.end());
        }
        reader.verify_exhausted();
        assert(joined == data);
        const auto digest = reader.digest_hex();
        assert(digest == bolster::Checksum::md5_hex(data));

        threw = false;
        try {
            reader.next();
        } catch (const std::out_of_range &) {
            threw = true;
        }
        assert(threw);

        reader.rewind();
        assert(reader.has_next());
        while (reader.has_next()) {
            reader.next();
        }
        assert(reader.digest_hex() == digest);
    }

    {
        // File shrank after the size was recorded.
        auto source = bolster::LocalFile::open_for_read(file_path);
        bolster::ChunkReader reader(source, 48, 16);
        reader.next();
        reader.next();
        threw = false;
        try {
            reader.next();
        } catch (const bolster::SizeMismatchError &err) {
            threw = true;
            assert(err.kind() == bolster::ErrorKind::SizeMismatch);
        }
        assert(threw);
    }

    {
        // File grew after the size was recorded.
        auto source = bolster::LocalFile::open_for_read(file_path);
        bolster::ChunkReader reader(source, 32, 16);
        reader.next();
        reader.next();
        assert(!reader.has_next());
        threw = false;
        try {
            reader.verify_exhausted();
        } catch (const bolster::SizeMismatchError &) {
            threw = true;
        }
        assert(threw);
    }

    threw = false;
    try {
        bolster::LocalFile::open_for_read(temp_dir.path() / "missing.bin");
    } catch (const bolster::IoError &err) {
        threw = true;
        assert(err.kind() == bolster::ErrorKind::Io);
    }
    assert(threw);

    {
        auto sink = bolster::LocalFile::create_for_write(temp_dir.path() / "out" / "sink.bin");
        sink.presize(40);
        assert(sink.size() == 40);
        sink.write_at(32, data.data() + 32, 8);
        sink.write_at(0, data.data(), 32);
    }
    assert(bolster_test::read_file(temp_dir.path() / "out" / "sink.bin") == data);
    return 0;
}
