#include <libnovapool/zkp/ProverWorker.h>
#include <test/support/BalanceCircuit.h>
#include <test/support/ExpectError.h>
#include <test/support/TestPermutation.h>

#include <xrpl/beast/unit_test.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace novapool {

using namespace zkp;

class ProverWorker_test : public beast::unit_test::suite
{
    struct Harness
    {
        PoolConfig config = test::balanceCircuitConfig();
        std::shared_ptr<test::MemoryArtifactSource> source =
            test::balanceCircuitSource();
        std::shared_ptr<test::BalanceWitnessCalculatorFactory> factory =
            std::make_shared<test::BalanceWitnessCalculatorFactory>();
        std::unique_ptr<ProverWorker> worker;
        std::vector<Json::Value> frames;
        std::uint64_t nextId = 0;

        Harness()
        {
            build();
        }

        void
        build()
        {
            worker = test::makeBalanceWorker(
                config, source, factory, test::nullJournal());
        }

        Json::Value
        send(MessageType type, Json::Value data = Json::Value(Json::objectValue))
        {
            return worker->handle(
                makeRequest(type, ++nextId, data),
                [this](Json::Value const& frame) { frames.push_back(frame); });
        }

        Json::Value
        sendRaw(std::string const& type)
        {
            Json::Value request(Json::objectValue);
            request["type"] = type;
            request["messageId"] = "99";
            return worker->handle(request, {});
        }
    };

    static std::string
    codeOf(Json::Value const& response)
    {
        return response["errorCode"].asString();
    }

    static Json::Value
    proveData(Json::Value const& inputs)
    {
        Json::Value data(Json::objectValue);
        data["inputs"] = inputs;
        return data;
    }

    void
    testStates()
    {
        testcase("Readiness");

        Harness h;
        auto ping = h.send(MessageType::Ping);
        BEAST_EXPECT(ping["success"].asBool());
        BEAST_EXPECT(ping["messageId"].asString() == "1");
        BEAST_EXPECT(ping["type"].asString() == "PING");
        BEAST_EXPECT(!ping["result"]["ready"].asBool());
        BEAST_EXPECT(!ping["result"]["state"]["modulesReady"].asBool());

        auto const info = h.send(MessageType::GetCircuitInfo);
        BEAST_EXPECT(!info["success"].asBool());
        BEAST_EXPECT(codeOf(info) == "WorkerNotReady");
        BEAST_EXPECT(codeOf(h.send(MessageType::Verify)) == "WorkerNotReady");
        BEAST_EXPECT(codeOf(h.send(MessageType::GetVk)) == "WorkerNotReady");

        BEAST_EXPECT(h.send(MessageType::InitModules)["success"].asBool());
        BEAST_EXPECT(h.worker->state().modulesReady);
        BEAST_EXPECT(!h.worker->state().witnessReady);

        auto const witness = h.send(MessageType::InitWitness);
        BEAST_EXPECT(witness["success"].asBool());
        BEAST_EXPECT(
            witness["result"]["circuitInfo"]["witnessSize"].asUInt() == 16);
        BEAST_EXPECT(h.worker->state().witnessReady);
        BEAST_EXPECT(!h.worker->state().proverReady);

        BEAST_EXPECT(!h.send(MessageType::CheckCache)["result"]["cached"].asBool());
        auto const prover = h.send(MessageType::InitProver);
        BEAST_EXPECT(prover["success"].asBool());
        BEAST_EXPECT(prover["result"]["info"]["numPublic"].asUInt() == 11);
        BEAST_EXPECT(prover["result"]["info"]["numConstraints"].asUInt() == 1);
        BEAST_EXPECT(h.send(MessageType::CheckCache)["result"]["cached"].asBool());

        auto const state = h.send(MessageType::GetState)["result"]["state"];
        BEAST_EXPECT(state["modulesReady"].asBool());
        BEAST_EXPECT(state["witnessReady"].asBool());
        BEAST_EXPECT(state["proverReady"].asBool());
        BEAST_EXPECT(h.send(MessageType::Ping)["result"]["ready"].asBool());

        // Repeating an init step does not reload anything
        h.send(MessageType::InitProver);
        BEAST_EXPECT(h.factory->created == 1);
        BEAST_EXPECT(h.source->fetches(test::balance_circuit::provingKeyUrl) == 1);

        auto const vk = h.send(MessageType::GetVk);
        BEAST_EXPECT(
            vk["result"]["verifyingKey"].asString().size() ==
            2 * (G1_SIZE + 3 * G2_SIZE + 4 + 12 * G1_SIZE));
    }

    void
    testProgress()
    {
        testcase("Progress frames");

        Harness h;
        h.send(MessageType::InitProver);
        BEAST_EXPECT(!h.frames.empty());
        for (auto const& frame : h.frames)
        {
            BEAST_EXPECT(frame["type"].asString() == "PROGRESS");
            BEAST_EXPECT(frame["messageId"].asString() == "1");
        }
        BEAST_EXPECT(h.frames.back()["percent"].asInt() == 100);
    }

    void
    testProve()
    {
        testcase("Prove and verify");

        Harness h;
        // PROVE initializes whatever is missing
        auto const proved = h.send(
            MessageType::Prove,
            proveData(test::balanceCircuitInputs(300, 0, 200, 500, 0)));
        BEAST_EXPECT(proved["success"].asBool());
        BEAST_EXPECT(h.worker->state().proverReady);

        auto const& result = proved["result"];
        BEAST_EXPECT(
            result["onChainProof"].asString().size() == 2 * ONCHAIN_PROOF_SIZE);
        BEAST_EXPECT(result["publicInputs"].size() == 11);
        BEAST_EXPECT(result["publicInputs"][0u].asString() == "1001");
        BEAST_EXPECT(result["publicInputs"][1u].asString() == "200");
        BEAST_EXPECT(result["timings"].isMember("witness"));
        BEAST_EXPECT(result["timings"].isMember("prove"));

        Json::Value verify(Json::objectValue);
        verify["proof"] = result["proof"];
        verify["publicInputs"] = result["publicInputs"];
        auto const ok = h.send(MessageType::Verify, verify);
        BEAST_EXPECT(ok["success"].asBool());
        BEAST_EXPECT(ok["result"]["verified"].asBool());

        verify["publicInputs"][1u] = "201";
        BEAST_EXPECT(
            !h.send(MessageType::Verify, verify)["result"]["verified"].asBool());

        verify["proof"] = "zz";
        BEAST_EXPECT(codeOf(h.send(MessageType::Verify, verify)) == "InvalidHex");
    }

    void
    testProveFailures()
    {
        testcase("Prove failures");

        Harness h;
        auto const unbalanced = h.send(
            MessageType::Prove,
            proveData(test::balanceCircuitInputs(300, 0, 200, 400, 0)));
        BEAST_EXPECT(!unbalanced["success"].asBool());
        BEAST_EXPECT(codeOf(unbalanced) == "ProverFailure");
        BEAST_EXPECT(
            unbalanced["error"].asString().find("Witness calculation failed") !=
            std::string::npos);

        auto inputs = test::balanceCircuitInputs(0, 0, 0, 0, 0);
        inputs["outAmount"][0u] = maxNoteAmount().str();
        inputs["publicAmount"] = maxNoteAmount().str();
        auto const overflow = h.send(MessageType::Prove, proveData(inputs));
        BEAST_EXPECT(codeOf(overflow) == "ProverFailure");
        BEAST_EXPECT(
            overflow["error"].asString().find("Num2Bits(248)") !=
            std::string::npos);

        BEAST_EXPECT(codeOf(h.send(MessageType::Prove)) == "ProverFailure");

        // The worker keeps serving after failures
        BEAST_EXPECT(h.send(
            MessageType::Prove,
            proveData(test::balanceCircuitInputs(1, 2, 3, 4, 2)))["success"]
                         .asBool());
    }

    void
    testUnknownTypes()
    {
        testcase("Unknown message types");

        Harness h;
        auto const unknown = h.sendRaw("SHUTDOWN");
        BEAST_EXPECT(!unknown["success"].asBool());
        BEAST_EXPECT(codeOf(unknown) == "UnknownMessageType");
        BEAST_EXPECT(unknown["messageId"].asString() == "99");
        BEAST_EXPECT(codeOf(h.sendRaw("READY")) == "UnknownMessageType");
        BEAST_EXPECT(codeOf(h.sendRaw("PROGRESS")) == "UnknownMessageType");
        BEAST_EXPECT(codeOf(h.sendRaw("")) == "UnknownMessageType");
    }

    void
    testFailedInit()
    {
        testcase("Failed initialization");

        Harness h;
        h.config.artifacts.circuitWasm = "mem://missing.wasm";
        h.build();

        auto const failed = h.send(MessageType::InitProver);
        BEAST_EXPECT(codeOf(failed) == "ArtifactFetchError");
        BEAST_EXPECT(h.worker->state().modulesReady);
        BEAST_EXPECT(!h.worker->state().witnessReady);

        Json::Value urls(Json::objectValue);
        urls["circuitWasmUrl"] = test::balance_circuit::wasmUrl;
        BEAST_EXPECT(h.send(MessageType::Configure, urls)["success"].asBool());
        BEAST_EXPECT(h.send(MessageType::InitProver)["success"].asBool());
        BEAST_EXPECT(h.worker->state().proverReady);

        // Keys for another constraint system
        Harness mismatch;
        mismatch.source->add(
            test::balance_circuit::r1csUrl, test::extendedCircuitR1cs());
        auto const rejected = mismatch.send(MessageType::InitProver);
        BEAST_EXPECT(codeOf(rejected) == "ProverFailure");
        BEAST_EXPECT(mismatch.worker->state().witnessReady);
        BEAST_EXPECT(!mismatch.worker->state().proverReady);

        // Hash self-test against the test permutation fails
        Harness selfTest;
        selfTest.config.verifyHashVectors = true;
        selfTest.build();
        BEAST_EXPECT(
            codeOf(selfTest.send(MessageType::InitModules)) == "ProverFailure");
        BEAST_EXPECT(!selfTest.worker->state().modulesReady);

        // A rejected WASM module
        Harness badWasm;
        badWasm.source->add(
            test::balance_circuit::wasmUrl, ripple::Blob{0, 'a', 's', 'm'});
        BEAST_EXPECT(
            codeOf(badWasm.send(MessageType::InitWitness)) == "ProverFailure");
        BEAST_EXPECT(!badWasm.worker->state().witnessReady);
    }

    void
    testCache()
    {
        testcase("Cache requests");

        Harness h;
        h.send(MessageType::InitProver);
        BEAST_EXPECT(h.send(MessageType::CheckCache)["result"]["cached"].asBool());
        BEAST_EXPECT(h.send(MessageType::ClearCache)["success"].asBool());
        BEAST_EXPECT(!h.send(MessageType::CheckCache)["result"]["cached"].asBool());
        // Loaded keys stay usable
        BEAST_EXPECT(h.worker->state().proverReady);
    }

    void
    testQueries()
    {
        testcase("Queries leave state alone");

        Harness h;
        auto const stateOf = [&h] {
            return h.send(MessageType::GetState)["result"]["state"];
        };

        auto const before = h.send(MessageType::Ping)["result"];
        BEAST_EXPECT(h.send(MessageType::Ping)["result"] == before);
        BEAST_EXPECT(!h.send(MessageType::CheckCache)["result"]["cached"].asBool());
        BEAST_EXPECT(!h.send(MessageType::CheckCache)["result"]["cached"].asBool());
        BEAST_EXPECT(h.send(MessageType::Ping)["result"] == before);
        BEAST_EXPECT(h.source->fetches(test::balance_circuit::provingKeyUrl) == 0);

        h.send(MessageType::InitProver);
        auto const ready = h.send(MessageType::Ping)["result"];
        BEAST_EXPECT(ready != before);
        auto const state = stateOf();
        for (int i = 0; i < 3; ++i)
        {
            BEAST_EXPECT(
                h.send(MessageType::CheckCache)["result"]["cached"].asBool());
            BEAST_EXPECT(h.send(MessageType::Ping)["result"] == ready);
            BEAST_EXPECT(stateOf() == state);
        }
        BEAST_EXPECT(h.factory->created == 1);
        BEAST_EXPECT(h.source->fetches(test::balance_circuit::provingKeyUrl) == 1);
    }

    void
    testQueue()
    {
        testcase("Worker thread");

        Harness h;
        std::mutex m;
        std::condition_variable cv;
        std::vector<Json::Value> messages;
        h.worker->start([&](Json::Value const& message) {
            std::lock_guard guard(m);
            messages.push_back(message);
            cv.notify_all();
        });

        for (std::uint64_t id = 1; id <= 3; ++id)
            h.worker->post(makeRequest(MessageType::Ping, id, Json::objectValue));

        {
            std::unique_lock guard(m);
            BEAST_EXPECT(cv.wait_for(guard, std::chrono::seconds(10), [&] {
                return messages.size() >= 4;
            }));
        }
        h.worker->stop();

        std::lock_guard guard(m);
        BEAST_EXPECT(messages.size() == 4);
        BEAST_EXPECT(messages[0]["type"].asString() == "READY");
        // Served in arrival order
        for (std::size_t i = 1; i < messages.size(); ++i)
            BEAST_EXPECT(
                messages[i]["messageId"].asString() == std::to_string(i));

        // Posting after stop is ignored
        h.worker->post(makeRequest(MessageType::Ping, 9, Json::objectValue));
    }

public:
    void
    run() override
    {
        initCurve();
        testStates();
        testProgress();
        testProve();
        testProveFailures();
        testUnknownTypes();
        testFailedInit();
        testCache();
        testQueries();
        testQueue();
    }
};

BEAST_DEFINE_TESTSUITE(ProverWorker, protocol, novapool);

}  // namespace novapool
