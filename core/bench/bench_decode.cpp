#include "bench_common.hpp"

#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/write.hpp>

#include <thread>

#include "core/options.hpp"
#include "protocol/buffer_source.hpp"
#include "protocol/instruction.hpp"
#include "protocol/instruction_decoder.hpp"
#include "protocol/stream_source.hpp"
#include "protocol/wire.hpp"

namespace
{
// set <key> <string payload>, repeated.
std::vector<unsigned char> build_set_stream(size_t value_size_, int count_)
{
    const std::string key = "bench:key";
    const std::string payload(value_size_, 'x');

    std::vector<unsigned char> out;
    out.reserve(static_cast<size_t>(count_)
                * (value_size_ + key.size() + 16));
    unsigned char len[4];
    for (int i = 0; i < count_; ++i) {
        out.push_back(zwire::opcode_set);
        out.push_back(zwire::operand_simple_string);
        out.insert(out.end(), key.begin(), key.end());
        out.push_back(zwire::zwire_protocol::delimiter0);
        out.push_back(zwire::zwire_protocol::delimiter1);
        out.push_back(zwire::operand_string);
        zwire::put_uint32(len, static_cast<uint32_t>(payload.size()));
        out.insert(out.end(), len, len + sizeof len);
        out.insert(out.end(), payload.begin(), payload.end());
    }
    return out;
}

zwire::instruction_schema_t make_schema()
{
    zwire::instruction_schema_t schema;
    const zwire::operand_t set[] = {zwire::operand_simple_string,
                                    zwire::operand_any};
    schema.define(zwire::opcode_set, set, 2);
    return schema;
}

bool run_buffer(size_t value_size_, int count_)
{
    const std::vector<unsigned char> wire = build_set_stream(value_size_,
                                                             count_);
    const zwire::instruction_schema_t schema = make_schema();
    zwire::options_t options;

    zwire::buffer_source_t source;
    if (source.init(wire.data(), wire.size()) == -1) {
        report_failure("buffer_source_t::init");
        return false;
    }
    zwire::instruction_decoder_t decoder(&source, options);
    zwire::instruction_t instr;

    stopwatch_t sw;
    sw.start();
    for (int i = 0; i < count_; ++i) {
        if (decoder.decode(schema, &instr) == -1) {
            report_failure("decode");
            return false;
        }
    }
    const double elapsed_ms = sw.elapsed_ms();

    const double throughput = count_ / (elapsed_ms / 1000.0);
    const double latency_us = elapsed_ms * 1000.0 / count_;
    print_result("buffer", "set", value_size_, throughput, latency_us);
    if (bench_debug_enabled())
        std::cerr << "buffer: " << source.bytes_read() << " bytes in "
                  << elapsed_ms << " ms" << std::endl;
    return true;
}

bool run_stream(size_t value_size_, int count_)
{
    const std::vector<unsigned char> wire = build_set_stream(value_size_,
                                                             count_);
    const zwire::instruction_schema_t schema = make_schema();
    zwire::options_t options;

    boost::asio::io_context io;
    boost::asio::local::stream_protocol::socket reader(io);
    boost::asio::local::stream_protocol::socket writer(io);
    boost::system::error_code ec;
    boost::asio::local::connect_pair(reader, writer, ec);
    if (ec) {
        std::cerr << "connect_pair failed: " << ec.message() << std::endl;
        return false;
    }

    std::thread feeder([&writer, &wire]() {
        boost::system::error_code wec;
        boost::asio::write(writer, boost::asio::buffer(wire), wec);
        if (wec && bench_debug_enabled())
            std::cerr << "write failed: " << wec.message() << std::endl;
        writer.shutdown(
          boost::asio::local::stream_protocol::socket::shutdown_send, wec);
    });

    zwire::stream_source_t<boost::asio::local::stream_protocol::socket>
      source(reader, options);
    zwire::instruction_decoder_t decoder(&source, options);
    zwire::instruction_t instr;

    bool ok = true;
    stopwatch_t sw;
    sw.start();
    for (int i = 0; i < count_; ++i) {
        if (decoder.decode(schema, &instr) == -1) {
            report_failure("decode");
            ok = false;
            break;
        }
    }
    const double elapsed_ms = sw.elapsed_ms();
    feeder.join();
    if (!ok)
        return false;

    const double throughput = count_ / (elapsed_ms / 1000.0);
    const double latency_us = elapsed_ms * 1000.0 / count_;
    print_result("stream", "set", value_size_, throughput, latency_us);
    return true;
}
}

int main()
{
    const int iterations = bench_iterations();
    for (size_t i = 0; i < VALUE_SIZES.size(); ++i) {
        const size_t size = VALUE_SIZES[i];
        // Keep the encoded stream for the biggest payloads in memory.
        const int count = size >= 65536 ? iterations / 100 + 1 : iterations;
        if (!run_buffer(size, count) || !run_stream(size, count))
            return 1;
    }
    return 0;
}
