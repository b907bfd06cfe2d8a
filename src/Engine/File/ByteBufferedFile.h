#pragma once
// Copyright (c) 2024, kiwec & 2026, hitcore contributors, All rights reserved.

#include "noinclude.h"
#include "types.h"

#include <array>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <type_traits>

// little-endian binary file access for the local databases
// strings are stored as uleb128 length followed by the raw bytes
class ByteBufferedFile {
   public:
    class Reader {
        NOCOPY_NOMOVE(Reader)
       public:
        Reader(std::string_view path);
        ~Reader() = default;

        [[nodiscard]] inline bool good() const { return this->last_error.empty(); }
        [[nodiscard]] inline std::string_view error() const { return this->last_error; }

        template <typename T>
        [[nodiscard]] T read() {
            static_assert(std::is_trivially_copyable_v<T>);
            T result{};
            this->read_bytes(reinterpret_cast<u8 *>(&result), sizeof(T));
            return result;
        }

        template <typename T>
        void skip() {
            this->skip_bytes(sizeof(T));
        }

        // returns the number of bytes actually read, short reads set an error and zero-fill the rest
        uSz read_bytes(u8 *out, uSz len);
        void skip_bytes(uSz len);

        [[nodiscard]] u32 read_uleb128();
        // false (and out left empty) on a truncated or oversized string
        bool read_string(std::string &out);
        void skip_string();

        uSz total_size{0};
        uSz total_pos{0};

       private:
        static constexpr const uSz READ_BUFFER_SIZE{4096};

        bool fill();
        void set_error(std::string_view error_msg);

        std::ifstream file;
        std::array<u8, READ_BUFFER_SIZE> buffer{};
        uSz buf_pos{0};
        uSz buf_len{0};

        std::string last_error;
    };

    // writes to a temporary file, which replaces the target on destruction if nothing failed
    class Writer {
        NOCOPY_NOMOVE(Writer)
       public:
        Writer(std::string_view path);
        ~Writer();

        [[nodiscard]] inline bool good() const { return this->last_error.empty(); }
        [[nodiscard]] inline std::string_view error() const { return this->last_error; }

        template <typename T>
        void write(const T &val) {
            static_assert(std::is_trivially_copyable_v<T>);
            this->write_bytes(reinterpret_cast<const u8 *>(&val), sizeof(T));
        }

        void write_bytes(const u8 *bytes, uSz n);
        void write_uleb128(u32 num);
        void write_string(std::string_view str);

        // flushes and moves the file into place, returns good()
        bool finish();

       private:
        static constexpr const uSz WRITE_BUFFER_SIZE{4096};

        void flush();
        void set_error(std::string_view error_msg);

        std::string file_path;
        std::string tmp_file_path;
        std::ofstream file;

        std::array<u8, WRITE_BUFFER_SIZE> buffer{};
        uSz pos{0};

        bool finished{false};
        std::string last_error;
    };
};
