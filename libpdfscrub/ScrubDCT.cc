#include <pdfscrub/ScrubDCT.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include <jpeglib.h>

#if BITS_IN_JSAMPLE != 8
# error "pdfscrub does not support libjpeg built with BITS_IN_JSAMPLE != 8"
#endif

namespace
{
    // libjpeg reports fatal errors by calling error_exit, which must not return.
    struct ErrorManager
    {
        jpeg_error_mgr pub;
        std::jmp_buf escape;
        std::string message;
    };

    void
    on_error(j_common_ptr cinfo)
    {
        auto* mgr = reinterpret_cast<ErrorManager*>(cinfo->err);
        char text[JMSG_LENGTH_MAX];
        (*cinfo->err->format_message)(cinfo, text);
        mgr->message = std::string("ScrubDCT: ") + text;
        std::longjmp(mgr->escape, 1);
    }

    // Level -1 warnings mean the data is damaged. Coefficients read from damaged data can't be
    // written back unchanged, so these are fatal too.
    void
    on_message(j_common_ptr cinfo, int level)
    {
        if (level < 0) {
            auto* mgr = reinterpret_cast<ErrorManager*>(cinfo->err);
            mgr->message = "ScrubDCT: JPEG data is corrupt";
            std::longjmp(mgr->escape, 1);
        }
    }

    // The libjpeg objects for one operation. An error inside run() jumps back to it, and the
    // objects are released when the session goes out of scope. Code passed to run() must not keep
    // objects with destructors on its own stack, since a jump skips them.
    struct JpegSession
    {
        JpegSession()
        {
            jpeg_std_error(&errors.pub);
            errors.pub.error_exit = on_error;
            errors.pub.emit_message = on_message;
            reader.err = &errors.pub;
            writer.err = &errors.pub;
            // jpeg_destroy_* ignores objects that were never created.
            reader.mem = nullptr;
            writer.mem = nullptr;
        }

        ~JpegSession()
        {
            jpeg_destroy_compress(&writer);
            jpeg_destroy_decompress(&reader);
            std::free(out_buffer);
        }

        JpegSession(JpegSession const&) = delete;
        JpegSession& operator=(JpegSession const&) = delete;

        template <typename Body>
        void
        run(Body body)
        {
            if (setjmp(errors.escape) != 0) {
                throw std::runtime_error(errors.message);
            }
            body();
        }

        jvirt_barray_ptr*
        readCoefficients(std::string const& jpeg)
        {
            jpeg_create_decompress(&reader);
            jpeg_mem_src(
                &reader,
                reinterpret_cast<unsigned char*>(const_cast<char*>(jpeg.data())),
                static_cast<unsigned long>(jpeg.size()));
            (void)jpeg_read_header(&reader, TRUE);
            return jpeg_read_coefficients(&reader);
        }

        // libjpeg grows the output buffer with malloc as needed.
        void
        startWriter()
        {
            jpeg_create_compress(&writer);
            jpeg_mem_dest(&writer, &out_buffer, &out_size);
        }

        std::string
        output() const
        {
            return {reinterpret_cast<char const*>(out_buffer), ScrubIntC::to_size(out_size)};
        }

        ErrorManager errors;
        jpeg_decompress_struct reader;
        jpeg_compress_struct writer;
        unsigned char* out_buffer{nullptr};
        unsigned long out_size{0};
    };

    // Calls fn on every AC coefficient of every block and counts the calls that returned true.
    template <typename F>
    size_t
    for_each_ac(jpeg_decompress_struct& cinfo, jvirt_barray_ptr* coefs, F fn)
    {
        size_t count = 0;
        for (int ci = 0; ci < cinfo.num_components; ++ci) {
            auto const& comp = cinfo.comp_info[ci];
            for (JDIMENSION row = 0; row < comp.height_in_blocks; ++row) {
                JBLOCKARRAY blocks = (*cinfo.mem->access_virt_barray)(
                    reinterpret_cast<j_common_ptr>(&cinfo), coefs[ci], row, 1, TRUE);
                for (JDIMENSION col = 0; col < comp.width_in_blocks; ++col) {
                    // Entry 0 is the DC coefficient.
                    for (int k = 1; k < DCTSIZE2; ++k) {
                        if (fn(blocks[0][col][k])) {
                            ++count;
                        }
                    }
                }
            }
        }
        return count;
    }
} // namespace

std::vector<int>
ScrubDCT::readACCoefficients(std::string const& jpeg)
{
    std::vector<int> result;
    JpegSession session;
    session.run([&]() {
        auto* coefs = session.readCoefficients(jpeg);
        for_each_ac(session.reader, coefs, [&result](JCOEF& c) {
            result.push_back(c);
            return false;
        });
        (void)jpeg_finish_decompress(&session.reader);
    });
    return result;
}

std::string
ScrubDCT::clearACLowBits(std::string const& jpeg, size_t& changed)
{
    changed = 0;
    JpegSession session;
    session.run([&]() {
        auto* coefs = session.readCoefficients(jpeg);
        changed = for_each_ac(session.reader, coefs, [](JCOEF& c) {
            if ((c >= 2 || c <= -2) && (c & 1)) {
                c = static_cast<JCOEF>(c & ~1);
                return true;
            }
            return false;
        });
        session.startWriter();
        jpeg_copy_critical_parameters(&session.reader, &session.writer);
        jpeg_write_coefficients(&session.writer, coefs);
        jpeg_finish_compress(&session.writer);
        (void)jpeg_finish_decompress(&session.reader);
    });
    return session.output();
}

std::string
ScrubDCT::compress(
    std::string const& samples, unsigned width, unsigned height, int components, int quality)
{
    if (components != 1 && components != 3) {
        throw std::logic_error("ScrubDCT::compress: components must be 1 or 3");
    }
    size_t row_width = ScrubIntC::to_size(width) * ScrubIntC::to_size(components);
    if (samples.size() != row_width * height) {
        throw std::runtime_error(
            "ScrubDCT::compress: expected " + std::to_string(row_width * height) +
            " bytes of samples but got " + std::to_string(samples.size()));
    }
    auto* pixels = reinterpret_cast<JSAMPLE*>(const_cast<char*>(samples.data()));
    JpegSession session;
    session.run([&]() {
        auto& w = session.writer;
        session.startWriter();
        w.image_width = width;
        w.image_height = height;
        w.input_components = components;
        w.in_color_space = components == 3 ? JCS_RGB : JCS_GRAYSCALE;
        jpeg_set_defaults(&w);
        jpeg_set_quality(&w, quality, TRUE);
        jpeg_start_compress(&w, TRUE);
        while (w.next_scanline < w.image_height) {
            JSAMPROW row = pixels + w.next_scanline * row_width;
            (void)jpeg_write_scanlines(&w, &row, 1);
        }
        jpeg_finish_compress(&w);
    });
    return session.output();
}
