#ifndef TUNNY_LORENZ_PIPELINE_PIPELINEDCIPHER_HPP
#define TUNNY_LORENZ_PIPELINE_PIPELINEDCIPHER_HPP

#include <tunny/lorenz/core/Cipher.hpp>
#include <tunny/lorenz/core/KeystreamGenerator.hpp>
#include <tunny/lorenz/core/SeedExpander.hpp>
#include <tunny/lorenz/core/Symbol.hpp>
#include <tunny/lorenz/pipeline/SymbolQueue.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <stdexcept>
#include <thread>

namespace tunny::lorenz {

/*
 * Same result as transform(), but the wheels are stepped on a producer
 * thread that feeds keystream through a bounded queue while the calling
 * thread does the combine. Stepping itself stays strictly sequential.
 */
struct PipelinedCipher {
    std::size_t capacity = 256;

    Message transform(std::span<const Symbol> message, KeystreamGenerator& gen) const {
        validateMessage(message);
        if (message.empty()) return {};

        SymbolQueue<Symbol> queue(capacity);
        std::exception_ptr  producerError;
        const std::size_t   n = message.size();

        std::thread producer([&] {
            try {
                for (std::size_t i = 0; i < n; ++i)
                    if (!queue.push(gen.next())) break;
            } catch (...) {
                producerError = std::current_exception();
            }
            queue.close();
        });

        // unblocks and joins the producer on every exit path
        struct Joiner {
            SymbolQueue<Symbol>& q;
            std::thread&         t;
            ~Joiner() {
                q.close();
                if (t.joinable()) t.join();
            }
        } joiner{queue, producer};

        Message out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            const auto key = queue.pop();
            if (!key) break;
            out.push_back(static_cast<Symbol>(message[i] ^ *key));
        }

        queue.close();
        producer.join();
        if (producerError) std::rethrow_exception(producerError);
        if (out.size() != n) throw std::runtime_error("PipelinedCipher: keystream ended early");
        return out;
    }

    Message transform(std::span<const Symbol> message, std::uint64_t seed) const {
        KeystreamGenerator gen(generate(seed));
        return transform(message, gen);
    }
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_PIPELINE_PIPELINEDCIPHER_HPP
