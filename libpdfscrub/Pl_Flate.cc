#include <pdfscrub/Pl_Flate.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

Pl_Flate::Members::Members(action_e action, size_t out_bufsize) :
    action(action),
    zs(std::make_unique<z_stream>()),
    outbuf(std::max(out_bufsize, size_t(1)))
{
}

Pl_Flate::Members::~Members()
{
    if (started) {
        if (action == a_deflate) {
            deflateEnd(zs.get());
        } else {
            inflateEnd(zs.get());
        }
    }
}

Pl_Flate::Pl_Flate(
    char const* identifier, Pipeline* next, action_e action, unsigned int out_bufsize) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>(action, out_bufsize))
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Flate with nullptr as next");
    }
}

// Out of line because Members is private to the library.
Pl_Flate::~Pl_Flate() = default;

void
Pl_Flate::setMemoryLimit(unsigned long long limit)
{
    m->memory_limit = limit;
}

void
Pl_Flate::setWarnCallback(std::function<void(char const*, int)> callback)
{
    m->warn = callback;
}

void
Pl_Flate::fail(char const* stage, int code)
{
    std::string msg = identifier + (m->action == a_deflate ? ": deflate: " : ": inflate: ") +
        stage + ": " + (m->zs->msg ? m->zs->msg : zError(code));
    throw std::runtime_error(msg);
}

void
Pl_Flate::start()
{
    if (m->started) {
        return;
    }
    int err = m->action == a_deflate ? deflateInit(m->zs.get(), Z_DEFAULT_COMPRESSION)
                                     : inflateInit(m->zs.get());
    if (err != Z_OK) {
        fail("Init", err);
    }
    m->started = true;
}

void
Pl_Flate::emit(size_t len)
{
    if (len == 0) {
        return;
    }
    if (m->action == a_inflate && m->memory_limit) {
        m->inflated += len;
        if (m->inflated > m->memory_limit) {
            throw std::runtime_error(identifier + ": inflate memory limit exceeded");
        }
    }
    next()->write(m->outbuf.data(), len);
}

void
Pl_Flate::write(unsigned char const* data, size_t len)
{
    if (m->finished) {
        throw std::logic_error(identifier + ": Pl_Flate: write() called after finish() called");
    }
    // zlib counts input in unsigned ints.
    size_t const max_chunk = size_t(1) << 30;
    while (len > 0) {
        auto chunk = std::min(len, max_chunk);
        run(data, chunk, m->action == a_inflate ? Z_SYNC_FLUSH : Z_NO_FLUSH);
        data += chunk;
        len -= chunk;
    }
}

void
Pl_Flate::run(unsigned char const* data, size_t len, int flush)
{
    start();
    auto& zs = *m->zs;
    // zlib doesn't write through next_in.
    zs.next_in = const_cast<unsigned char*>(data);
    zs.avail_in = ScrubIntC::to_uint(len);
    while (true) {
        zs.next_out = m->outbuf.data();
        zs.avail_out = ScrubIntC::to_uint(m->outbuf.size());
        int err = m->action == a_deflate ? deflate(&zs, flush) : inflate(&zs, flush);
        if (m->action == a_inflate && err == Z_DATA_ERROR && zs.msg &&
            strcmp(zs.msg, "incorrect data check") == 0) {
            // A bad checksum after complete data is accepted, as other PDF readers do.
            err = Z_STREAM_END;
        }
        if (err == Z_BUF_ERROR) {
            // No progress was possible. For inflate this means the data ended early.
            if (m->warn) {
                m->warn("input stream is complete but output may still be valid", err);
            }
            return;
        }
        if (err != Z_OK && err != Z_STREAM_END) {
            fail("data", err);
        }
        emit(m->outbuf.size() - zs.avail_out);
        if (err == Z_STREAM_END || (zs.avail_in == 0 && zs.avail_out > 0)) {
            return;
        }
    }
}

void
Pl_Flate::finish()
{
    if (!m->finished) {
        m->finished = true;
        // An empty input still deflates to a complete zlib stream.
        if (m->started || m->action == a_deflate) {
            run(nullptr, 0, Z_FINISH);
            int err = m->action == a_deflate ? deflateEnd(m->zs.get()) : inflateEnd(m->zs.get());
            m->started = false;
            if (err != Z_OK) {
                fail("End", err);
            }
        }
    }
    next()->finish();
}
