#ifndef BOUNDINGBOXRESOLVER_H
#define BOUNDINGBOXRESOLVER_H

#include "models/Surface.h"

class CalculationDiagnostics;

/**
 * @brief Computes the 2D footprint covering two surfaces
 */
class BoundingBoxResolver
{
public:
    /**
     * @brief Resolve the combined extent of two surfaces
     *
     * An empty surface contributes nothing; when only one surface has points
     * the box is that surface's extent.
     * @param surfaceA First surface (must not be null)
     * @param surfaceB Second surface (must not be null)
     * @param boxOut Output parameter for the combined box
     * @param diagnostics Receives InvalidInput or EmptyData errors
     * @return true on success
     */
    static bool resolve(const Surface *surfaceA,
                        const Surface *surfaceB,
                        BoundingBox &boxOut,
                        CalculationDiagnostics &diagnostics);
};

#endif // BOUNDINGBOXRESOLVER_H
