#include "lmc_capi.h"
#include "lmc_assembler.h"
#include "lmc_machine.h" // Include the C++ machine class
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

// --- Error Handling ---
thread_local std::string lastErrorMessage;

static void setLastError(const std::string& message) {
    lastErrorMessage = message;
}

const char* lmc_get_last_error() {
    return lastErrorMessage.empty() ? nullptr : lastErrorMessage.c_str();
}
// --- End Error Handling ---


// Define the opaque struct locally
struct MachineOpaque {
    Machine machine; // Contains the actual C++ machine instance
    std::shared_ptr<IntWriter> output = std::make_shared<IntWriter>();

    explicit MachineOpaque(bool debug) {
        machine.setDebugMode(debug);
        machine.setOutput(output);
        machine.setInput(std::make_shared<IntReader>());
    }
};

// --- C API Implementation ---

extern "C" {

MachineOpaque* lmc_create_machine(int debugMode) {
    setLastError(""); // Clear previous error
    try {
        return new MachineOpaque(debugMode != 0);
    } catch (const std::bad_alloc&) {
        setLastError("Failed to allocate memory for machine.");
        return nullptr;
    } catch (const std::exception& e) {
        setLastError("Failed to create machine: " + std::string(e.what()));
        return nullptr;
    }
}

void lmc_destroy_machine(MachineOpaque* handle) {
    setLastError("");
    delete handle;
}

LmcResult lmc_assemble_and_load(MachineOpaque* handle, const char* source) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (source == nullptr) {
        setLastError("Source text cannot be null.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    try {
        handle->machine.load(assemble(source));
        handle->output->reset();
        return LMC_OK;
    } catch (const AssemblyError& e) {
        setLastError(e.what());
        return LMC_ERROR_ASSEMBLY_FAILED;
    } catch (const std::exception& e) {
        setLastError("Failed to load program: " + std::string(e.what()));
        return LMC_ERROR_LOAD_FAILED;
    }
}

LmcResult lmc_load_image_file(MachineOpaque* handle, const char* imageFile) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (imageFile == nullptr) {
        setLastError("Image file path cannot be null.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    try {
        handle->machine.load(readImageFile(imageFile));
        handle->output->reset();
        return LMC_OK;
    } catch (const std::exception& e) {
        setLastError("Failed to load image: " + std::string(e.what()));
        return LMC_ERROR_LOAD_FAILED;
    }
}

LmcResult lmc_set_inputs(MachineOpaque* handle, const int32_t* values, int count) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (count < 0 || (count > 0 && values == nullptr)) {
        setLastError("Input array is null or count is negative.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    std::vector<int> cards(values, values + count);
    handle->machine.setInput(std::make_shared<IntReader>(std::move(cards)));
    return LMC_OK;
}

LmcResult lmc_single_step(MachineOpaque* handle) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    handle->machine.singleStep();
    return LMC_OK;
}

LmcResult lmc_run(MachineOpaque* handle, int maxSteps) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (maxSteps > 0) {
        handle->machine.run(maxSteps);
    } else {
        handle->machine.run();
    }
    return LMC_OK;
}

LmcResult lmc_reset(MachineOpaque* handle) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    handle->machine.reset();
    handle->output->reset();
    return LMC_OK;
}

LmcResult lmc_get_register(MachineOpaque* handle, int reg, int32_t* outValue) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (outValue == nullptr) {
        setLastError("Output value pointer cannot be null.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    const Machine& machine = handle->machine;
    switch (reg) {
        case LMC_REG_PC: *outValue = machine.getPC(); break;
        case LMC_REG_ACC: *outValue = machine.getACC(); break;
        case LMC_REG_MAR: *outValue = machine.getMAR(); break;
        case LMC_REG_MDR: *outValue = machine.getMDR(); break;
        case LMC_REG_CIR: *outValue = machine.getCIR().opcode * MEMORY_SIZE + machine.getCIR().address; break;
        case LMC_REG_FLAGS: *outValue = (machine.isZero() ? 1 : 0) | (machine.isNonNegative() ? 2 : 0); break;
        default:
            setLastError("Register index out of bounds.");
            return LMC_ERROR_INVALID_ARGUMENT;
    }
    return LMC_OK;
}

LmcResult lmc_read_memory(MachineOpaque* handle, int address, int32_t* outValue) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (outValue == nullptr) {
        setLastError("Output value pointer cannot be null.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    try {
        *outValue = handle->machine.readMemory(address);
        return LMC_OK;
    } catch (const std::out_of_range& e) {
        setLastError("Error reading memory: " + std::string(e.what()));
        return LMC_ERROR_MEMORY;
    }
}

LmcResult lmc_get_run_state(MachineOpaque* handle, int32_t* outState) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (outState == nullptr) {
        setLastError("Output state pointer cannot be null.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    switch (handle->machine.runState()) {
        case RunState::RUNNING: *outState = LMC_STATE_RUNNING; break;
        case RunState::HALTED: *outState = LMC_STATE_HALTED; break;
        case RunState::ABORTED: *outState = LMC_STATE_ABORTED; break;
    }
    return LMC_OK;
}

LmcResult lmc_get_output(MachineOpaque* handle, int32_t* buffer, int capacity, int* outCount) {
    setLastError("");
    if (handle == nullptr) {
        setLastError("Invalid machine handle.");
        return LMC_ERROR_INVALID_HANDLE;
    }
    if (outCount == nullptr || capacity < 0 || (capacity > 0 && buffer == nullptr)) {
        setLastError("Invalid output buffer arguments.");
        return LMC_ERROR_INVALID_ARGUMENT;
    }
    const std::vector<int>& data = handle->output->data();
    *outCount = static_cast<int>(data.size());
    for (int i = 0; i < capacity && i < static_cast<int>(data.size()); ++i) {
        buffer[i] = data[i];
    }
    return LMC_OK;
}

const char* lmc_get_machine_error(MachineOpaque* handle) {
    if (handle == nullptr || handle->machine.runState() != RunState::ABORTED) return nullptr;
    return handle->machine.errorMessage().c_str();
}


} // extern "C"
