/**
 * =============================================================================
 * Model.hpp - Abstract Inference Backend
 * =============================================================================
 *
 * The pipeline only needs three things from a network:
 *
 *   model.setInput(0, inputTensor);            // hand over the input
 *   model.run();                               // synchronous forward pass
 *   auto outputs = model.getOutputTensors();   // read the results
 *
 * OnnxModel implements this over ONNX Runtime. Tests substitute a fake
 * that returns fixed logits.
 *
 * @file Model.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef MODEL_HPP
#define MODEL_HPP

#include "Tensor.hpp"

#include <cstddef>
#include <vector>

class Model {
public:
    virtual ~Model() = default;

    /**
     * Set the tensor fed to input `slot` on the next run().
     * The model takes ownership of the tensor.
     *
     * @throws InferenceError(InferenceFailure) if slot does not exist
     */
    virtual void setInput(std::size_t slot, Tensor tensor) = 0;

    /**
     * Execute the network. Blocks until the forward pass completes.
     *
     * @throws InferenceError(InferenceFailure) on any backend error
     */
    virtual void run() = 0;

    /** Outputs of the last successful run(), in model output order. */
    virtual std::vector<Tensor> getOutputTensors() const = 0;
};

#endif // MODEL_HPP
