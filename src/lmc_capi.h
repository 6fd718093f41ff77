#ifndef LMC_CAPI_H
#define LMC_CAPI_H

#include "common_defs.h" // For LMC_API
#include <stdint.h>      // For standard integer types like int32_t

#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle to the machine instance
typedef struct MachineOpaque* LmcMachineHandle;

// Error codes
typedef enum {
    LMC_OK = 0,
    LMC_ERROR_GENERAL = -1,
    LMC_ERROR_INVALID_HANDLE = -2,
    LMC_ERROR_LOAD_FAILED = -3,
    LMC_ERROR_ASSEMBLY_FAILED = -4,
    LMC_ERROR_INVALID_ARGUMENT = -5,
    LMC_ERROR_MEMORY = -6
} LmcResult;

// Register selectors for lmc_get_register
typedef enum {
    LMC_REG_PC = 0,
    LMC_REG_ACC = 1,
    LMC_REG_MAR = 2,
    LMC_REG_MDR = 3,
    LMC_REG_CIR = 4,   // opcode * 100 + address
    LMC_REG_FLAGS = 5  // bit 0: zero, bit 1: non-negative
} LmcRegister;

// Run states reported by lmc_get_run_state
typedef enum {
    LMC_STATE_RUNNING = 0,
    LMC_STATE_HALTED = 1,
    LMC_STATE_ABORTED = 2
} LmcRunState;

/**
 * @brief Creates a new machine with zeroed memory and registers.
 * @param debugMode 1 to enable debug logging, 0 otherwise.
 * @return A handle to the new machine, or NULL on failure.
 */
LMC_API LmcMachineHandle lmc_create_machine(int debugMode);

/**
 * @brief Destroys a machine and frees associated resources.
 * @param handle The handle to the machine.
 */
LMC_API void lmc_destroy_machine(LmcMachineHandle handle);

/**
 * @brief Assembles LMC source text and loads the result.
 * @param handle The handle to the machine.
 * @param source NUL-terminated program text.
 * @return LMC_OK on success, LMC_ERROR_ASSEMBLY_FAILED with the positioned message in lmc_get_last_error().
 */
LMC_API LmcResult lmc_assemble_and_load(LmcMachineHandle handle, const char* source);

/**
 * @brief Loads an assembled image file (.bin).
 * @param handle The handle to the machine.
 * @param imageFile Path to the image file.
 * @return LMC_OK on success, or an error code on failure.
 */
LMC_API LmcResult lmc_load_image_file(LmcMachineHandle handle, const char* imageFile);

/**
 * @brief Replaces the input queue with signed values (-500..499 meaningful).
 * @param handle The handle to the machine.
 * @param values Array of values, may be NULL when count is 0.
 * @param count Number of values.
 * @return LMC_OK on success, or an error code on failure.
 */
LMC_API LmcResult lmc_set_inputs(LmcMachineHandle handle, const int32_t* values, int count);

/**
 * @brief Executes one fetch-decode-execute cycle (no-op once halted or aborted).
 */
LMC_API LmcResult lmc_single_step(LmcMachineHandle handle);

/**
 * @brief Runs until the machine halts or aborts, or maxSteps cycles have executed.
 * @param maxSteps Step budget; 0 or negative means unlimited.
 */
LMC_API LmcResult lmc_run(LmcMachineHandle handle, int maxSteps);

/**
 * @brief Resets registers and flags, keeping memory and clearing collected output.
 */
LMC_API LmcResult lmc_reset(LmcMachineHandle handle);

/**
 * @brief Gets the value of a register.
 * @param handle The handle to the machine.
 * @param reg Which register, see LmcRegister.
 * @param outValue Pointer to store the register value.
 * @return LMC_OK on success, or an error code on failure.
 */
LMC_API LmcResult lmc_get_register(LmcMachineHandle handle, int reg, int32_t* outValue);

/**
 * @brief Reads a word from memory.
 * @param address Memory address 0..99.
 * @param outValue Pointer to store the word (0..999).
 */
LMC_API LmcResult lmc_read_memory(LmcMachineHandle handle, int address, int32_t* outValue);

/**
 * @brief Gets the run state, see LmcRunState.
 */
LMC_API LmcResult lmc_get_run_state(LmcMachineHandle handle, int32_t* outState);

/**
 * @brief Copies collected OUT values (unsigned words) into a caller buffer.
 * @param buffer Destination, may be NULL to query the count only.
 * @param capacity Number of values buffer can hold.
 * @param outCount Receives the total number of values collected.
 */
LMC_API LmcResult lmc_get_output(LmcMachineHandle handle, int32_t* buffer, int capacity, int* outCount);

/**
 * @brief Gets the runtime error message of an aborted machine.
 * @return The message, or NULL if the machine has not aborted.
 */
LMC_API const char* lmc_get_machine_error(LmcMachineHandle handle);

/**
 * @brief Gets the last error message set by an API call on this thread.
 * @return A pointer to the last error message string, or NULL if no error.
 */
LMC_API const char* lmc_get_last_error();


#ifdef __cplusplus
} // extern "C"
#endif

#endif // LMC_CAPI_H
