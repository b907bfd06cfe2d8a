// Copyright (c) 2024, kiwec & 2026, hitcore contributors, All rights reserved.
#include "ByteBufferedFile.h"

#include "Logging.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

ByteBufferedFile::Reader::Reader(std::string_view path) {
    std::error_code ec;
    const fs::path fsPath{path};

    const auto size = fs::file_size(fsPath, ec);
    if(ec) {
        this->set_error(fmt::format("Failed to stat file: {}", ec.message()));
        return;
    }

    this->file.open(fsPath, std::ios::binary);
    if(!this->file.is_open()) {
        this->set_error("Failed to open file for reading");
        return;
    }

    this->total_size = (uSz)size;
}

void ByteBufferedFile::Reader::set_error(std::string_view error_msg) {
    // only keep the first error, everything after it is a consequence
    if(!this->last_error.empty()) return;
    this->last_error = error_msg;
}

bool ByteBufferedFile::Reader::fill() {
    if(!this->good() || !this->file.good()) return false;

    this->file.read(reinterpret_cast<char *>(this->buffer.data()), (std::streamsize)this->buffer.size());
    this->buf_len = (uSz)this->file.gcount();
    this->buf_pos = 0;
    return this->buf_len > 0;
}

uSz ByteBufferedFile::Reader::read_bytes(u8 *out, uSz len) {
    uSz done = 0;
    while(done < len) {
        if(this->buf_pos >= this->buf_len && !this->fill()) {
            this->set_error(fmt::format("Tried to read {} bytes past end of file", len - done));
            if(out != nullptr) std::memset(out + done, 0, len - done);
            return done;
        }

        const uSz n = std::min(len - done, this->buf_len - this->buf_pos);
        if(out != nullptr) std::memcpy(out + done, this->buffer.data() + this->buf_pos, n);
        this->buf_pos += n;
        this->total_pos += n;
        done += n;
    }
    return done;
}

void ByteBufferedFile::Reader::skip_bytes(uSz len) { (void)this->read_bytes(nullptr, len); }

u32 ByteBufferedFile::Reader::read_uleb128() {
    u32 result = 0;
    u32 shift = 0;
    u8 byte = 0;

    do {
        byte = this->read<u8>();
        if(!this->good()) return 0;
        if(shift >= 32) {
            this->set_error("uleb128 value overflows 32 bits");
            return 0;
        }
        result |= (u32)(byte & 0x7f) << shift;
        shift += 7;
    } while(byte & 0x80);

    return result;
}

bool ByteBufferedFile::Reader::read_string(std::string &out) {
    out.clear();

    const u32 len = this->read_uleb128();
    if(!this->good()) return false;

    if(len > this->total_size - std::min(this->total_pos, this->total_size)) {
        this->set_error(fmt::format("String length {} exceeds remaining file size", len));
        return false;
    }

    out.resize(len);
    if(this->read_bytes(reinterpret_cast<u8 *>(out.data()), len) != len) {
        out.clear();
        return false;
    }
    return true;
}

void ByteBufferedFile::Reader::skip_string() {
    const u32 len = this->read_uleb128();
    this->skip_bytes(len);
}

//**************//
//	 Writer	    //
//**************//

ByteBufferedFile::Writer::Writer(std::string_view path) : file_path(path), tmp_file_path(fmt::format("{}.tmp", path)) {
    this->file.open(fs::path{this->tmp_file_path}, std::ios::binary | std::ios::trunc);
    if(!this->file.is_open()) {
        this->set_error("Failed to open file for writing");
    }
}

ByteBufferedFile::Writer::~Writer() {
    if(!this->finished) {
        // nothing to report to here, the caller didn't ask
        (void)this->finish();
    }
}

void ByteBufferedFile::Writer::set_error(std::string_view error_msg) {
    if(!this->last_error.empty()) return;
    this->last_error = error_msg;
    debugLog("{}: {}", this->file_path, error_msg);
}

void ByteBufferedFile::Writer::flush() {
    if(!this->good() || this->pos == 0) return;

    this->file.write(reinterpret_cast<const char *>(this->buffer.data()), (std::streamsize)this->pos);
    if(!this->file.good()) {
        this->set_error("Failed to write to file");
    }
    this->pos = 0;
}

void ByteBufferedFile::Writer::write_bytes(const u8 *bytes, uSz n) {
    if(!this->good() || this->finished) return;

    while(n > 0) {
        if(this->pos == this->buffer.size()) {
            this->flush();
            if(!this->good()) return;
        }

        const uSz chunk = std::min(n, this->buffer.size() - this->pos);
        std::memcpy(this->buffer.data() + this->pos, bytes, chunk);
        this->pos += chunk;
        bytes += chunk;
        n -= chunk;
    }
}

void ByteBufferedFile::Writer::write_uleb128(u32 num) {
    do {
        u8 next = num & 0x7f;
        num >>= 7;
        if(num != 0) next |= 0x80;
        this->write<u8>(next);
    } while(num != 0);
}

void ByteBufferedFile::Writer::write_string(std::string_view str) {
    this->write_uleb128((u32)str.size());
    this->write_bytes(reinterpret_cast<const u8 *>(str.data()), str.size());
}

bool ByteBufferedFile::Writer::finish() {
    if(this->finished) return this->good();
    this->finished = true;

    this->flush();
    if(this->file.is_open()) this->file.close();

    std::error_code ec;
    if(!this->good()) {
        fs::remove(this->tmp_file_path, ec);
        return false;
    }

    fs::rename(this->tmp_file_path, this->file_path, ec);
    if(ec) {
        this->set_error(fmt::format("Failed to move temporary file into place: {}", ec.message()));
        fs::remove(this->tmp_file_path, ec);
        return false;
    }

    return true;
}
