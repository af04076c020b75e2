#include "Error.hpp"

#include "cpptrace/cpptrace.hpp"

#include <sstream>

[[nodiscard]] std::string err::err_msg_with_trace(const std::string& msg) {
    std::ostringstream trace;

    cpptrace::generate_trace().print(trace);

    return std::string{msg + '\n' + trace.str()};
}

namespace {

class DownloadCategory final : public std::error_category {
    public:
        [[nodiscard]] const char* name() const noexcept override { return "rangeget::download"; }

        [[nodiscard]] std::string message(int ev) const override {
            using rangeget::DownloadErrc;

            switch (static_cast<DownloadErrc>(ev)) {
                case DownloadErrc::success:
                    return "Success";
                case DownloadErrc::probe_failed:
                    return "There was an error while sending a HTTP HEAD request to the server";
                case DownloadErrc::unknown_file_size:
                    return "The server did not report the size of the file";
                case DownloadErrc::connection_failed:
                    return "Failed while opening a range connection";
                case DownloadErrc::timeout:
                    return "Internet connection lost (timed out)";
                case DownloadErrc::tls_error:
                    return "Internet connection lost (TLS failure)";
                case DownloadErrc::http_error:
                    return "The server answered the range request with an error status";
                case DownloadErrc::range_not_supported:
                    return "The server does not support byte range requests";
                case DownloadErrc::truncated_response:
                    return "The server closed the connection before the range was complete";
                case DownloadErrc::unexpected_body_length:
                    return "The server sent more bytes than the requested range";
                case DownloadErrc::metadata_write_failed:
                    return "Unable to write to metadata file";
                case DownloadErrc::metadata_read_failed:
                    return "Unable to read the metadata file";
                case DownloadErrc::metadata_corrupt:
                    return "The metadata file is corrupt";
                case DownloadErrc::metadata_size_mismatch:
                    return "The metadata file does not match the size of the file";
                case DownloadErrc::metadata_remove_failed:
                    return "Unable to delete the metadata file";
                case DownloadErrc::output_file_failed:
                    return "Unable to create file";
                case DownloadErrc::output_write_failed:
                    return "Unable to write data to downloaded file";
                case DownloadErrc::mirror_list_unreadable:
                    return "Failed reading given server list file";
                case DownloadErrc::invalid_url:
                    return "The given argument is not a valid URL";
                case DownloadErrc::invalid_argument:
                    return "Invalid argument";
                case DownloadErrc::cancelled:
                    return "Download cancelled";
                case DownloadErrc::invalid_chunk:
                    return "Received a chunk that does not fit the file";
            }
            return "Unknown error";
        }
};

}  // namespace

namespace rangeget {

const std::error_category& download_category() noexcept {
    static const DownloadCategory category;
    return category;
}

}  // namespace rangeget
